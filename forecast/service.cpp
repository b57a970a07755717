// forecast/service.cpp
#include "forecast/service.h"
#include <algorithm>
#include <utility>
#include "common/log.h"

void MemoryForecastSink::store(const ForecastSet &set)
{
  std::lock_guard<std::mutex> g(mu_);
  sets_.push_back(set);
}

std::vector<ForecastSet> MemoryForecastSink::stored() const
{
  std::lock_guard<std::mutex> g(mu_);
  return sets_;
}

size_t MemoryForecastSink::count() const
{
  std::lock_guard<std::mutex> g(mu_);
  return sets_.size();
}

ForecastSet select_horizons(const ForecastSet &set, const std::vector<int> &horizons)
{
  ForecastSet out = set;
  auto wanted = [&horizons](int h)
  { return std::binary_search(horizons.begin(), horizons.end(), h); };
  std::erase_if(out.points, [&](const ForecastPoint &p) { return !wanted(p.horizon_hours); });
  std::erase_if(out.failures, [&](const HorizonFailure &f) { return !wanted(f.horizon_hours); });
  return out;
}

ForecastService::ForecastService(const ObservationSource &obs,
                                 const EnsemblePredictor &pred,
                                 const FeatureBuilder &fb,
                                 ForecastCache &cache,
                                 ForecastSink *sink,
                                 const ServiceConfig &sc,
                                 const HorizonConfig &hc,
                                 WallClock clock)
    : obs_(obs), pred_(pred), fb_(fb), cache_(cache), sink_(sink), cfg_(sc),
      sched_(fb, pred, hc), clock_(std::move(clock)) {}

ForecastSet ForecastService::compute(const std::string &location_id, const Observation &current,
                                     const std::vector<int> &horizons, EpochSeconds as_of,
                                     double free_flow_speed, uint32_t budget_ms) const
{
  std::vector<Observation> window = obs_.history(location_id, cfg_.history_hours);
  std::reverse(window.begin(), window.end()); // oldest -> newest

  HorizonRequest hr;
  hr.location_id = location_id;
  hr.current = current;
  hr.horizons = horizons;
  hr.window = std::move(window);
  hr.as_of = as_of;
  hr.free_flow_speed = free_flow_speed;
  hr.per_horizon_budget_ms = budget_ms;
  return sched_.forecast(hr);
}

ForecastResponse ForecastService::forecast(const ForecastRequest &req)
{
  if (req.location_id.empty())
    throw InvalidRequestError("location_id is required");
  if (req.free_flow_speed < 0.0)
    throw InvalidRequestError("free_flow_speed must be positive");

  const std::vector<int> requested = sched_.normalize_horizons(req.horizons.empty() ? cfg_.default_horizons : req.horizons);

  // Entries are per (location, hour), so each computation covers the
  // default horizons as well as whatever this caller asked for.
  std::vector<int> all = cfg_.default_horizons;
  all.insert(all.end(), requested.begin(), requested.end());
  all = sched_.normalize_horizons(all);

  const EpochSeconds as_of = req.as_of.value_or(clock_());
  const double ffs = req.free_flow_speed > 0.0 ? req.free_flow_speed : cfg_.free_flow_speed;

  ForecastSet set;
  CacheOutcome oc;
  if (req.observation)
  {
    // A caller-supplied observation bypasses the shared (location, hour) entry.
    set = compute(req.location_id, *req.observation, all, as_of, ffs, req.per_horizon_budget_ms);
    oc.computed = true;
  }
  else
  {
    auto compute_fn = [&]() -> ForecastSet
    {
      std::optional<Observation> cur = obs_.latest(req.location_id);
      if (!cur)
        throw ObservationUnavailable(req.location_id);
      return compute(req.location_id, *cur, all, as_of, ffs, req.per_horizon_budget_ms);
    };

    set = cache_.get_or_compute(req.location_id, as_of, compute_fn, &oc);
    const ModelSnapshot model = pred_.snapshot();
    const bool stale = model && set.model_id != model->model_id;
    if (stale || !set.covers(requested))
    {
      LOG_DEBUG("forecast %s: cached set %s, recomputing", req.location_id.c_str(),
                stale ? "names a replaced model" : "lacks requested horizons");
      cache_.invalidate(req.location_id, as_of);
      set = cache_.get_or_compute(req.location_id, as_of, compute_fn, &oc);
    }
  }

  if (oc.computed && sink_ && !set.empty())
  {
    try
    {
      sink_->store(set);
    }
    catch (const std::exception &e)
    {
      LOG_ERROR("forecast %s: sink write failed: %s", req.location_id.c_str(), e.what());
    }
  }

  // Speeds follow this caller's free-flow speed, whoever computed the set.
  for (auto &p : set.points)
  {
    const SpeedEstimate s = pred_.estimate_speed(p.congestion, ffs);
    p.current_speed = s.current_speed;
    p.speed_reduction_percent = s.speed_reduction_percent;
  }

  ForecastResponse resp;
  resp.set = select_horizons(set, requested);
  resp.model_id = set.model_id;
  resp.model_version = set.model_version;
  resp.cache_hit = oc.hit;
  if (req.include_feature_importance)
    resp.feature_importance = pred_.feature_importance();
  return resp;
}

std::vector<RefreshOutcome> ForecastService::refresh_all(const std::vector<int> &horizons)
{
  const uint64_t t0 = now_ms();
  std::vector<RefreshOutcome> out;
  const std::vector<std::string> locs = obs_.locations();
  out.reserve(locs.size());

  size_t failed = 0;
  for (const auto &loc : locs)
  {
    RefreshOutcome r;
    r.location_id = loc;
    try
    {
      ForecastRequest req;
      req.location_id = loc;
      req.horizons = horizons;
      const ForecastResponse resp = forecast(req);
      r.ok = true;
      r.partial = resp.set.partial();
      r.points = resp.set.points.size();
    }
    catch (const ForecastError &e)
    {
      r.error = e.what();
      ++failed;
      LOG_WARN("refresh %s: %s (%s)", loc.c_str(), e.what(), error_class_name(e.error_class()));
    }
    catch (const std::exception &e)
    {
      r.error = e.what();
      ++failed;
      LOG_ERROR("refresh %s: %s", loc.c_str(), e.what());
    }
    out.push_back(std::move(r));
  }
  LOG_INFO("refresh: %zu locations, %zu failed, %llums", locs.size(), failed,
           static_cast<unsigned long long>(now_ms() - t0));
  return out;
}
