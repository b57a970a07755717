// model/bundle.h
#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/timers.h"
#include "model/regressor.h"
#include "model/scaler.h"

inline constexpr const char *kBundleSchema = "traffic-forecast-bundle/2";

struct TrainingMetrics
{
  double mse = 0.0;
  double rmse = 0.0;
  double mae = 0.0;
  double r2 = 0.0;
  size_t train_rows = 0;
  size_t holdout_rows = 0;
};

// Everything prediction needs, frozen together. Held through
// shared_ptr<const TrainedModel> and never mutated after construction.
struct TrainedModel
{
  std::string model_id;
  std::string version = kBundleSchema;
  EpochSeconds created_at = 0;
  std::vector<std::string> feature_names;
  FeatureScaler scaler;
  std::unique_ptr<Regressor> stable;   // random forest
  std::unique_ptr<Regressor> reactive; // gradient boosting
  TrainingMetrics metrics;

  [[nodiscard]] bool complete() const
  {
    return stable && reactive && stable->fitted() && reactive->fitted() &&
           scaler.fitted() && scaler.width() == feature_names.size();
  }

  // Averaged, normalized importance of both regressors, by feature name.
  [[nodiscard]] std::map<std::string, double> feature_importance() const;
};

nlohmann::json bundle_to_json(const TrainedModel &m);
// Throws ModelArtifactError / FeatureShapeError; never returns a partial model.
std::shared_ptr<const TrainedModel> bundle_from_json(const nlohmann::json &j);

// Writes the whole bundle to `path` or nothing (temp file + rename).
void save_bundle(const TrainedModel &m, const std::string &path);
std::shared_ptr<const TrainedModel> load_bundle(const std::string &path);
