// forecast/horizon.cpp
#include "forecast/horizon.h"
#include <algorithm>
#include "common/log.h"
#include "common/timers.h"

HorizonScheduler::HorizonScheduler(const FeatureBuilder &fb, const EnsemblePredictor &pred, const HorizonConfig &c)
    : fb_(fb), pred_(pred), cfg_(c) {}

std::vector<int> HorizonScheduler::normalize_horizons(const std::vector<int> &horizons) const
{
  if (horizons.empty())
    throw InvalidRequestError("at least one forecast horizon is required");
  for (int h : horizons)
  {
    if (h < 1 || h > cfg_.max_horizon_hours)
      throw InvalidRequestError("forecast horizon " + std::to_string(h) + "h outside [1, " +
                                std::to_string(cfg_.max_horizon_hours) + "]");
  }
  std::vector<int> out = horizons;
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

double HorizonScheduler::coarse_confidence(int horizon_hours) const
{
  const double c = cfg_.coarse_base - cfg_.coarse_decay_per_hour * static_cast<double>(horizon_hours);
  return std::clamp(c, cfg_.coarse_floor, cfg_.coarse_ceiling);
}

ForecastSet HorizonScheduler::forecast(const HorizonRequest &req) const
{
  const std::vector<int> horizons = normalize_horizons(req.horizons);

  // One snapshot for the whole set so every point names the same model.
  const ModelSnapshot model = pred_.snapshot();
  if (!model)
    throw ModelNotLoadedError();

  ForecastSet out;
  out.location_id = req.location_id;
  out.as_of = req.as_of;
  out.bucket = hour_bucket(req.as_of);
  out.model_id = model->model_id;
  out.model_version = model->version;
  out.points.reserve(horizons.size());

  for (int h : horizons)
  {
    const EpochSeconds target = req.as_of + static_cast<EpochSeconds>(h) * kSecPerHour;
    Deadline dl{.start_ms = now_ms(), .budget_ms = req.per_horizon_budget_ms};
    try
    {
      // Calendar fields describe the instant being forecast.
      const FeatureVector fv = fb_.build(req.current, target, req.window);
      if (log_threshold() == LogLevel::Debug)
        LOG_DEBUG("forecast %s +%dh: %s", req.location_id.c_str(), h, describe_features(fv).c_str());
      const EnsemblePrediction p = pred_.predict(fv, *model);

      if (dl.expired())
      {
        LOG_WARN("forecast %s +%dh: over budget (%ums > %ums), dropped",
                 req.location_id.c_str(), h, dl.elapsed(), dl.budget_ms);
        out.failures.push_back({h, HorizonFailureKind::BudgetExceeded,
                                "scoring took " + std::to_string(dl.elapsed()) + "ms, budget " +
                                    std::to_string(dl.budget_ms) + "ms"});
        continue;
      }

      const SpeedEstimate s = pred_.estimate_speed(p.congestion, req.free_flow_speed);
      ForecastPoint pt;
      pt.target_time = target;
      pt.horizon_hours = h;
      pt.congestion = p.congestion;
      pt.level = level_from_percent(p.congestion);
      pt.confidence = p.confidence_pct / 100.0;
      pt.horizon_confidence = coarse_confidence(h);
      pt.current_speed = s.current_speed;
      pt.speed_reduction_percent = s.speed_reduction_percent;
      pt.model = model->model_id;
      out.points.push_back(std::move(pt));
    }
    catch (const FeatureShapeError &e)
    {
      LOG_ERROR("forecast %s +%dh: %s", req.location_id.c_str(), h, e.what());
      out.failures.push_back({h, HorizonFailureKind::FeatureShape, e.what()});
    }
    catch (const std::exception &e)
    {
      LOG_ERROR("forecast %s +%dh failed: %s", req.location_id.c_str(), h, e.what());
      out.failures.push_back({h, HorizonFailureKind::ScoringError, e.what()});
    }
  }

  if (out.partial())
    LOG_WARN("forecast %s: %zu of %zu horizons failed", req.location_id.c_str(),
             out.failures.size(), horizons.size());
  return out;
}
