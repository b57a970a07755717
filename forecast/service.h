// forecast/service.h
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "cache/cache.h"
#include "common/schema.h"
#include "features/features.h"
#include "forecast/horizon.h"
#include "ingest/ingest.h"
#include "predict/predict.h"

// Downstream persistence of computed forecast sets.
class ForecastSink
{
public:
  virtual ~ForecastSink() = default;
  virtual void store(const ForecastSet &set) = 0;
};

class MemoryForecastSink : public ForecastSink
{
public:
  void store(const ForecastSet &set) override;

  [[nodiscard]] std::vector<ForecastSet> stored() const;
  [[nodiscard]] size_t count() const;

private:
  mutable std::mutex mu_;
  std::vector<ForecastSet> sets_;
};

struct ServiceConfig
{
  std::vector<int> default_horizons{1, 3, 6, 12, 24};
  double free_flow_speed = 60.0;
  size_t history_hours = kMaxWindow;
};

struct ForecastRequest
{
  std::string location_id;
  std::vector<int> horizons; // empty = ServiceConfig::default_horizons
  bool include_feature_importance = false;
  double free_flow_speed = 0.0; // 0 = ServiceConfig::free_flow_speed
  uint32_t per_horizon_budget_ms = 0;
  std::optional<Observation> observation; // else latest from the source
  std::optional<EpochSeconds> as_of;      // else the wall clock
};

struct ForecastResponse
{
  ForecastSet set;
  std::string model_id;
  std::string model_version;
  std::map<std::string, double> feature_importance;
  bool cache_hit = false;
};

struct RefreshOutcome
{
  std::string location_id;
  bool ok = false;
  bool partial = false;
  size_t points = 0;
  std::string error;
};

class ForecastService
{
public:
  ForecastService(const ObservationSource &obs,
                  const EnsemblePredictor &pred,
                  const FeatureBuilder &fb,
                  ForecastCache &cache,
                  ForecastSink *sink = nullptr,
                  const ServiceConfig &sc = {},
                  const HorizonConfig &hc = {},
                  WallClock clock = system_wall_clock());

  // Throws InvalidRequestError, ObservationUnavailable, ModelNotLoadedError.
  ForecastResponse forecast(const ForecastRequest &req);

  // One pass over every known location; never throws for a single location.
  std::vector<RefreshOutcome> refresh_all(const std::vector<int> &horizons = {});

  [[nodiscard]] const HorizonScheduler &scheduler() const { return sched_; }

private:
  const ObservationSource &obs_;
  const EnsemblePredictor &pred_;
  const FeatureBuilder &fb_;
  ForecastCache &cache_;
  ForecastSink *sink_;
  ServiceConfig cfg_;
  HorizonScheduler sched_;
  WallClock clock_;

  ForecastSet compute(const std::string &location_id, const Observation &current,
                      const std::vector<int> &horizons, EpochSeconds as_of,
                      double free_flow_speed, uint32_t budget_ms) const;
};

// Points and failures of `set` restricted to `horizons` (already normalized).
ForecastSet select_horizons(const ForecastSet &set, const std::vector<int> &horizons);
