// features/features.h
#pragma once
#include <string>
#include <vector>
#include "common/schema.h"

// Values used when an observation (or a lag slot) lacks a field.
struct FeatureDefaults
{
  double temperature = 20.0;
  double precipitation = 0.0;
  double visibility = 10.0;
  double vehicle_count = 100.0;
  double average_speed = 40.0;
  double congestion_level = 2.0; // ordinal scale
};

// Only the last 24 hourly readings of the window matter.
inline constexpr size_t kMaxWindow = 24;

class FeatureBuilder
{
public:
  FeatureBuilder() = default;
  explicit FeatureBuilder(const FeatureDefaults &d) : def_(d) {}

  // window: same location, oldest -> newest, one reading per hour.
  // as_of: instant being forecast; drives the calendar fields.
  [[nodiscard]] FeatureVector build(const Observation &obs,
                                    EpochSeconds as_of,
                                    const std::vector<Observation> &window) const;

  [[nodiscard]] const FeatureDefaults &defaults() const { return def_; }

private:
  FeatureDefaults def_;

  double lag_congestion(const std::vector<Observation> &window, size_t back) const;
};

// name -> value, in schema order; for logs and debugging output.
std::string describe_features(const FeatureVector &fv);
