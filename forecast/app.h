// forecast/app.h
#pragma once
#include <memory>
#include <string>
#include "alert/alert.h"
#include "cache/cache.h"
#include "features/features.h"
#include "forecast/horizon.h"
#include "forecast/service.h"
#include "ingest/ingest.h"
#include "predict/predict.h"
#include "train/train.h"

struct AppConfig
{
  std::string model_path = "models/traffic_ensemble.json";
  std::string training_source = "synthetic"; // synthetic | historical
  size_t synthetic_samples = 10000;
  IngestConfig ingest{};
  PredConfig pred{};
  TrainConfig train{};
  CacheConfig cache{};
  ServiceConfig service{};
  HorizonConfig horizon{};
  AlertConfig alert{};
};

// Defaults overridden by TF_* / LOCATIONS / HOURS environment variables.
AppConfig load_config_from_env();
void log_config(const AppConfig &cfg);

// One process worth of engine: synthetic feed, predictor, cache, service,
// trainer and alerting wired together for the drivers.
class ForecastApp
{
public:
  explicit ForecastApp(const AppConfig &cfg);

  // Fills the observation store with cfg.ingest.hours readings per location.
  void seed_observations(EpochSeconds end_ts);

  ModelSnapshot bootstrap();
  ModelSnapshot retrain();

  [[nodiscard]] const AppConfig &config() const { return cfg_; }
  MemoryObservationStore &store() { return store_; }
  EnsemblePredictor &predictor() { return pred_; }
  ForecastCache &cache() { return cache_; }
  MemoryForecastSink &sink() { return sink_; }
  ForecastService &service() { return service_; }
  AlertEvaluator &alerts() { return alerts_; }
  const TrainingPipeline &trainer() const { return trainer_; }

private:
  AppConfig cfg_;
  MemoryObservationStore store_;
  SyntheticIngestor ingestor_;
  FeatureBuilder fb_;
  EnsemblePredictor pred_;
  ForecastCache cache_;
  MemoryForecastSink sink_;
  ForecastService service_;
  TrainingPipeline trainer_;
  AlertEvaluator alerts_;
  std::unique_ptr<TrainingDataSource> source_;
};
