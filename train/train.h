// train/train.h
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "common/schema.h"
#include "features/features.h"
#include "ingest/ingest.h"
#include "model/boosting.h"
#include "model/bundle.h"
#include "model/forest.h"
#include "model/scaler.h"
#include "predict/predict.h"

struct TrainingData
{
  std::vector<FeatureVector> rows;
  std::vector<double> labels; // congestion percent

  [[nodiscard]] size_t size() const { return rows.size(); }
};

struct TrainConfig
{
  double holdout_fraction = 0.2;
  uint32_t seed = 42;
  size_t min_samples = 50;
  ForestConfig forest{};
  BoostConfig boost{};
  ScalerConfig scaler{};
};

struct TrainResult
{
  ModelSnapshot model;
  TrainingMetrics metrics;
};

// Time-of-day congestion prior with weekend damping and Gaussian noise,
// rendered through the same 15-field schema the service scores.
TrainingData generate_synthetic(size_t n, uint32_t seed = 42);

class TrainingDataSource
{
public:
  virtual ~TrainingDataSource() = default;

  virtual TrainingData load() = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

class SyntheticDataSource : public TrainingDataSource
{
public:
  explicit SyntheticDataSource(size_t samples = 10000, uint32_t seed = 42)
      : samples_(samples), seed_(seed) {}

  TrainingData load() override { return generate_synthetic(samples_, seed_); }
  std::string name() const override { return "synthetic"; }

private:
  size_t samples_;
  uint32_t seed_;
};

// Turns recorded observations into (features, next-hour congestion) pairs.
class HistoricalDataSource : public TrainingDataSource
{
public:
  HistoricalDataSource(const ObservationSource &obs, const FeatureBuilder &fb, size_t history_hours = 24 * 14)
      : obs_(obs), fb_(fb), history_hours_(history_hours) {}

  TrainingData load() override;
  std::string name() const override { return "historical"; }

private:
  const ObservationSource &obs_;
  const FeatureBuilder &fb_;
  size_t history_hours_;
};

// kind: "synthetic" | "historical". Throws InvalidRequestError for other
// kinds, or "historical" without an observation source.
std::unique_ptr<TrainingDataSource> make_training_source(const std::string &kind,
                                                         size_t synthetic_samples,
                                                         uint32_t seed,
                                                         const ObservationSource *obs,
                                                         const FeatureBuilder &fb);

class TrainingPipeline
{
public:
  explicit TrainingPipeline(const TrainConfig &c = {});

  // Throws TrainingDataInsufficient / FeatureShapeError; never returns a
  // half-built model.
  [[nodiscard]] TrainResult train(const std::vector<FeatureVector> &rows,
                                  const std::vector<double> &labels) const;
  [[nodiscard]] TrainResult train(const TrainingData &data) const { return train(data.rows, data.labels); }

  // Train, persist (when path is non-empty), then swap into the predictor.
  // Any failure leaves the predictor's current model in service and is
  // rethrown to the caller.
  ModelSnapshot retrain_and_swap(EnsemblePredictor &pred, TrainingDataSource &src, const std::string &path) const;

  // Loads the bundle at path; trains and persists a fresh one when it is
  // missing or unusable.
  ModelSnapshot load_or_bootstrap(EnsemblePredictor &pred, TrainingDataSource &src, const std::string &path) const;

  [[nodiscard]] const TrainConfig &config() const { return cfg_; }

private:
  TrainConfig cfg_;
};
