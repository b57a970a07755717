// model/boosting.h
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "model/regressor.h"

struct BoostConfig
{
  int rounds = 100;
  double learning_rate = 0.1;
  int num_leaves = 31;
  int max_depth = 5;
  int min_data_in_leaf = 20;
  double subsample = 1.0; // bagging fraction per round
  int threads = 0;        // 0 = LightGBM default
  uint32_t seed = 42;
};

// LightGBM gbdt with an L2 objective; the "reactive" half of the ensemble.
class GradientBoostingRegressor : public Regressor
{
public:
  explicit GradientBoostingRegressor(const BoostConfig &c = {});
  ~GradientBoostingRegressor() override;
  GradientBoostingRegressor(const GradientBoostingRegressor &) = delete;
  GradientBoostingRegressor &operator=(const GradientBoostingRegressor &) = delete;

  void fit(const FeatureMatrix &X, const std::vector<double> &y) override;
  double predict_row(const double *x, size_t n) const override;
  void predict_batch(const FeatureMatrix &X, std::vector<double> &out) const override;

  std::string kind() const override { return "gradient_boosting"; }
  size_t n_features() const override { return n_features_; }
  bool fitted() const override { return booster_ != nullptr; }
  std::vector<double> feature_importance() const override { return importance_; }

  nlohmann::json to_json() const override;
  static std::unique_ptr<GradientBoostingRegressor> from_json(const nlohmann::json &j);

  [[nodiscard]] int iterations() const { return iterations_; }

private:
  BoostConfig cfg_;
  void *booster_ = nullptr; // BoosterHandle, kept opaque in the header
  size_t n_features_ = 0;
  int iterations_ = 0;
  std::vector<double> importance_;

  std::string booster_params() const;
  // Replaces the booster with one parsed from `model`; throws ModelArtifactError.
  void load_model_string(const std::string &model, size_t expected_features);
  void release();
};
