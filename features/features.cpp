// features/features.cpp
#include "features/features.h"
#include <cstdio>

namespace
{
  inline double flag(const std::optional<bool> &b) { return b.value_or(false) ? 1.0 : 0.0; }
}

double FeatureBuilder::lag_congestion(const std::vector<Observation> &window, size_t back) const
{
  // back = 1 -> last element, back = 3 -> third-from-last, ...
  if (window.size() < back)
    return def_.congestion_level;
  const auto &o = window[window.size() - back];
  return o.congestion_level ? static_cast<double>(*o.congestion_level) : def_.congestion_level;
}

FeatureVector FeatureBuilder::build(const Observation &obs,
                                    EpochSeconds as_of,
                                    const std::vector<Observation> &window) const
{
  FeatureVector fv;
  fv.f.assign(kNumFeatures, 0.0);

  const int dow = day_of_week(as_of);
  fv[F_HOUR] = static_cast<double>(hour_of_day(as_of));
  fv[F_DOW] = static_cast<double>(dow);
  fv[F_WEEKEND] = dow >= 5 ? 1.0 : 0.0;
  fv[F_HOLIDAY] = flag(obs.is_holiday);

  fv[F_TEMPERATURE] = obs.temperature.value_or(def_.temperature);
  fv[F_PRECIPITATION] = obs.precipitation.value_or(def_.precipitation);
  fv[F_VISIBILITY] = obs.visibility.value_or(def_.visibility);

  fv[F_VEHICLE_COUNT] = obs.vehicle_count ? static_cast<double>(*obs.vehicle_count) : def_.vehicle_count;
  fv[F_AVG_SPEED] = obs.average_speed.value_or(def_.average_speed);
  fv[F_INCIDENT] = flag(obs.incident_reported);
  fv[F_EVENT] = flag(obs.event_nearby);

  if (window.empty())
  {
    // No history: the current reading stands in for the last hour.
    fv[F_LAG_1H] = obs.congestion_level ? static_cast<double>(*obs.congestion_level) : def_.congestion_level;
    fv[F_LAG_3H] = def_.congestion_level;
    fv[F_LAG_24H] = def_.congestion_level;
    fv[F_SPEED_LAG_1H] = obs.average_speed.value_or(def_.average_speed);
    return fv;
  }

  fv[F_LAG_1H] = lag_congestion(window, 1);
  fv[F_LAG_3H] = lag_congestion(window, 3);
  fv[F_LAG_24H] = lag_congestion(window, 24);
  fv[F_SPEED_LAG_1H] = window.back().average_speed.value_or(def_.average_speed);
  return fv;
}

std::string describe_features(const FeatureVector &fv)
{
  std::string out;
  char buf[64];
  for (size_t i = 0; i < fv.size(); ++i)
  {
    const std::string_view name = i < kNumFeatures ? kFeatureNames[i] : std::string_view{"?"};
    std::snprintf(buf, sizeof(buf), "%s%.*s=%.3f", i ? " " : "",
                  static_cast<int>(name.size()), name.data(), fv[i]);
    out += buf;
  }
  return out;
}
