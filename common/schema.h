// common/schema.h
#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "common/errors.h"
#include "common/timers.h"

// Field order shared by FeatureBuilder and TrainingPipeline. Changing it
// invalidates every persisted bundle.
inline constexpr size_t kNumFeatures = 15;
inline constexpr std::array<std::string_view, kNumFeatures> kFeatureNames = {
    "hour_of_day", "day_of_week", "is_weekend", "is_holiday",
    "temperature", "precipitation", "visibility",
    "vehicle_count", "average_speed", "incident_reported", "event_nearby",
    "congestion_lag_1h", "congestion_lag_3h", "congestion_lag_24h", "speed_lag_1h"};

enum FeatureIndex : size_t
{
  F_HOUR = 0,
  F_DOW,
  F_WEEKEND,
  F_HOLIDAY,
  F_TEMPERATURE,
  F_PRECIPITATION,
  F_VISIBILITY,
  F_VEHICLE_COUNT,
  F_AVG_SPEED,
  F_INCIDENT,
  F_EVENT,
  F_LAG_1H,
  F_LAG_3H,
  F_LAG_24H,
  F_SPEED_LAG_1H
};
static_assert(F_SPEED_LAG_1H + 1 == kNumFeatures, "FeatureIndex out of sync with kFeatureNames");

inline std::vector<std::string> feature_name_list()
{
  return std::vector<std::string>(kFeatureNames.begin(), kFeatureNames.end());
}

// One recorded reading for a location. Optional fields are absent when the
// upstream feed did not report them.
struct Observation
{
  std::string location_id;
  double lat = 0.0;
  double lon = 0.0;
  EpochSeconds ts = 0;
  std::optional<int> congestion_level; // ordinal 1..5
  std::optional<double> average_speed; // km/h
  std::optional<int> vehicle_count;
  std::optional<double> temperature;   // deg C
  std::optional<double> precipitation; // mm/h
  std::optional<double> visibility;    // km
  std::optional<bool> incident_reported;
  std::optional<bool> event_nearby;
  std::optional<bool> is_holiday;
};

struct FeatureVector
{
  std::vector<double> f;

  [[nodiscard]] size_t size() const { return f.size(); }
  double operator[](size_t i) const { return f[i]; }
  double &operator[](size_t i) { return f[i]; }
};

// Canonical congestion scale is 0..100 percent. The 1..5 ordinal level only
// exists at the edges (observations in, rounded level out).
inline constexpr double kCongestionMin = 0.0;
inline constexpr double kCongestionMax = 100.0;
inline constexpr int kLevelMin = 1;
inline constexpr int kLevelMax = 5;

[[nodiscard]] inline int level_from_percent(double pct)
{
  if (!std::isfinite(pct))
    return kLevelMin;
  const int lvl = static_cast<int>(std::floor(pct / 20.0)) + 1;
  return std::clamp(lvl, kLevelMin, kLevelMax);
}

// Midpoint of the level's percent band.
[[nodiscard]] inline double percent_from_level(int level)
{
  const int l = std::clamp(level, kLevelMin, kLevelMax);
  return (l - 1) * 20.0 + 10.0;
}

struct ForecastPoint
{
  EpochSeconds target_time = 0;
  int horizon_hours = 0;
  double congestion = 0.0;         // 0..100
  int level = kLevelMin;           // 1..5
  double confidence = 0.0;         // 0..1, model agreement
  double horizon_confidence = 0.0; // 0..1, coarse decay by horizon
  double current_speed = 0.0;      // km/h
  double speed_reduction_percent = 0.0;
  std::string model;

  bool operator==(const ForecastPoint &) const = default;
};

enum class HorizonFailureKind : uint8_t
{
  FeatureShape = 0,
  BudgetExceeded = 1,
  ScoringError = 2
};

inline const char *horizon_failure_name(HorizonFailureKind k)
{
  switch (k)
  {
  case HorizonFailureKind::FeatureShape:
    return "feature_shape";
  case HorizonFailureKind::BudgetExceeded:
    return "budget_exceeded";
  case HorizonFailureKind::ScoringError:
    return "scoring_error";
  }
  return "unknown";
}

struct HorizonFailure
{
  int horizon_hours = 0;
  HorizonFailureKind kind = HorizonFailureKind::ScoringError;
  std::string message;

  bool operator==(const HorizonFailure &) const = default;
};

struct ForecastSet
{
  std::string location_id;
  EpochSeconds as_of = 0;
  EpochSeconds bucket = 0; // as_of truncated to the hour
  std::string model_id;
  std::string model_version;
  std::vector<ForecastPoint> points;     // ascending horizon
  std::vector<HorizonFailure> failures;  // horizons omitted from points

  [[nodiscard]] bool empty() const { return points.empty(); }
  [[nodiscard]] bool partial() const { return !failures.empty(); }

  [[nodiscard]] const ForecastPoint *find(int horizon) const
  {
    for (const auto &p : points)
      if (p.horizon_hours == horizon)
        return &p;
    return nullptr;
  }

  // True when every horizon was either scored or recorded as failed.
  [[nodiscard]] bool covers(const std::vector<int> &horizons) const
  {
    for (int h : horizons)
    {
      if (find(h))
        continue;
      const bool failed = std::any_of(failures.begin(), failures.end(),
                                      [h](const HorizonFailure &f) { return f.horizon_hours == h; });
      if (!failed)
        return false;
    }
    return true;
  }

  // BudgetExceeded depends on the caller's budget, not on the inputs.
  [[nodiscard]] bool has_transient_failure() const
  {
    return std::any_of(failures.begin(), failures.end(),
                       [](const HorizonFailure &f) { return f.kind == HorizonFailureKind::BudgetExceeded; });
  }

  void require_complete() const
  {
    if (failures.empty())
      return;
    std::vector<int> hs;
    hs.reserve(failures.size());
    std::string msg = "forecast for '" + location_id + "' missing horizons:";
    for (const auto &f : failures)
    {
      hs.push_back(f.horizon_hours);
      msg += " " + std::to_string(f.horizon_hours) + "h(" + horizon_failure_name(f.kind) + ")";
    }
    throw PartialHorizonFailure(msg, std::move(hs));
  }

  bool operator==(const ForecastSet &) const = default;
};

// Fixed-size record for raw MPI transfers of forecast points.
struct ForecastWire
{
  uint32_t location_index;
  int32_t horizon_hours;
  int64_t target_time;
  float congestion;
  float confidence;
  float horizon_confidence;
  float current_speed;
  uint8_t level;
  uint8_t failed; // 0 = scored, else HorizonFailureKind + 1 (value fields unused)
};

static_assert(sizeof(ForecastWire) >= 4 + 4 + 8 + 4 * 4 + 2, "ForecastWire size mismatch");
