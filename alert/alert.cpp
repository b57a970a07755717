// alert/alert.cpp
#include "alert/alert.h"
#include <algorithm>
#include <utility>
#include "common/log.h"

AlertEvaluator::AlertEvaluator(const AlertConfig &c, WallClock clock)
    : cfg_(c), clock_(std::move(clock)) {}

bool AlertEvaluator::evaluate(const ForecastSet &set, AlertDecision &d) const
{
  // Heuristic de-rate when some horizons are missing.
  const int derate_pct = set.partial() ? std::clamp<int>(cfg_.heuristic_derate_pct, 0, 100) : 100;
  const AlertReason reason = set.partial() ? AlertReason::Heuristic : AlertReason::Model;

  // points are ascending by horizon, so the first hit is the most urgent
  for (const auto &p : set.points)
  {
    if (p.horizon_hours > cfg_.max_horizon_hours)
      break;
    if (p.level < cfg_.level_threshold)
      continue;
    const double conf = p.confidence * derate_pct / 100.0;
    if (conf < cfg_.min_confidence)
      continue;

    d.location_id = set.location_id;
    d.horizon_hours = p.horizon_hours;
    d.target_time = p.target_time;
    d.congestion = p.congestion;
    d.level = p.level;
    d.confidence = conf;
    d.reason = reason;
    return true;
  }
  return false;
}

void AlertEvaluator::decide(const ForecastSet &set, std::vector<AlertDecision> &out)
{
  AlertDecision d;
  if (!evaluate(set, d))
    return;

  const EpochSeconds now = clock_();
  {
    std::lock_guard<std::mutex> g(mu_);
    auto it = last_alert_.find(set.location_id);
    if (it != last_alert_.end() && now - it->second < static_cast<EpochSeconds>(cfg_.cooldown_sec))
    {
      ++suppressed_;
      LOG_DEBUG("alert %s suppressed, cooling down (%llds left)", set.location_id.c_str(),
                static_cast<long long>(cfg_.cooldown_sec - (now - it->second)));
      return;
    }
    last_alert_[set.location_id] = now;
  }

  LOG_INFO("alert %s: level %d (%.1f%%) in %dh, conf %.2f [%s]", d.location_id.c_str(), d.level,
           d.congestion, d.horizon_hours, d.confidence, alert_reason_name(d.reason));
  out.push_back(std::move(d));
}

void AlertEvaluator::decide(const std::vector<ForecastSet> &sets, std::vector<AlertDecision> &out)
{
  out.clear();
  out.reserve(sets.size());
  for (const auto &s : sets)
    decide(s, out);
}

void AlertEvaluator::reset(const std::string &location_id)
{
  std::lock_guard<std::mutex> g(mu_);
  last_alert_.erase(location_id);
}

uint64_t AlertEvaluator::suppressed() const
{
  std::lock_guard<std::mutex> g(mu_);
  return suppressed_;
}
