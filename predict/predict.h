// predict/predict.h
#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "common/schema.h"
#include "model/bundle.h"

using ModelSnapshot = std::shared_ptr<const TrainedModel>;

struct PredConfig
{
  double confidence_ceiling = 95.0; // percent
  double confidence_floor = 70.0;   // percent
  double max_speed_reduction = 0.6; // at 100 % congestion
};

struct EnsemblePrediction
{
  double congestion = 0.0;     // 0..100, clipped mean of both models
  double confidence_pct = 0.0; // 70..95
  double stable_output = 0.0;  // raw, unclipped
  double reactive_output = 0.0;
};

struct SpeedEstimate
{
  double current_speed = 0.0;
  double speed_reduction_percent = 0.0;
};

struct ModelInfo
{
  bool loaded = false;
  std::string model_id;
  std::string version;
  EpochSeconds created_at = 0;
  std::vector<std::string> feature_names;
  std::string stable_kind;
  std::string reactive_kind;
  TrainingMetrics metrics;
};

// Scores feature vectors against the current model snapshot. The snapshot is
// swapped atomically; callers in flight keep the one they started with.
class EnsemblePredictor
{
public:
  explicit EnsemblePredictor(const PredConfig &c = {});

  void load(ModelSnapshot m);
  void unload();
  [[nodiscard]] ModelSnapshot snapshot() const { return model_.load(std::memory_order_acquire); }
  [[nodiscard]] bool loaded() const { return snapshot() != nullptr; }

  // Throws ModelNotLoadedError / FeatureShapeError.
  [[nodiscard]] EnsemblePrediction predict(const FeatureVector &fv) const;
  [[nodiscard]] EnsemblePrediction predict(const FeatureVector &fv, const TrainedModel &m) const;

  [[nodiscard]] SpeedEstimate estimate_speed(double congestion, double free_flow_speed) const;

  [[nodiscard]] std::map<std::string, double> feature_importance() const;
  [[nodiscard]] ModelInfo model_info() const;

private:
  PredConfig cfg_;
  std::atomic<ModelSnapshot> model_;
};
