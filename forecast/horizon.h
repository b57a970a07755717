// forecast/horizon.h
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "common/schema.h"
#include "features/features.h"
#include "predict/predict.h"

struct HorizonConfig
{
  int max_horizon_hours = 168;
  double coarse_base = 0.85;
  double coarse_decay_per_hour = 0.02;
  double coarse_floor = 0.5;
  double coarse_ceiling = 0.95;
};

struct HorizonRequest
{
  std::string location_id;
  Observation current;
  std::vector<int> horizons;
  std::vector<Observation> window; // oldest -> newest
  EpochSeconds as_of = 0;
  double free_flow_speed = 60.0;
  uint32_t per_horizon_budget_ms = 0; // 0 = unbounded
};

// Expands one observation into a forecast per requested horizon.
class HorizonScheduler
{
public:
  HorizonScheduler(const FeatureBuilder &fb, const EnsemblePredictor &pred, const HorizonConfig &c = {});

  // Throws InvalidRequestError for bad horizons and ModelNotLoadedError when
  // no model is loaded; per-horizon problems end up in ForecastSet::failures.
  [[nodiscard]] ForecastSet forecast(const HorizonRequest &req) const;

  // Sorted, de-duplicated, range-checked copy of the requested horizons.
  [[nodiscard]] std::vector<int> normalize_horizons(const std::vector<int> &horizons) const;

  // Horizon-only confidence used to rank horizons cheaply; independent of
  // the model's agreement-based confidence.
  [[nodiscard]] double coarse_confidence(int horizon_hours) const;

private:
  const FeatureBuilder &fb_;
  const EnsemblePredictor &pred_;
  HorizonConfig cfg_;
};
