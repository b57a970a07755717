// model/forest.h
#pragma once
#include <cstdint>
#include <vector>
#include "model/regressor.h"
#include "model/tree.h"

struct ForestConfig
{
  int trees = 100;
  TreeConfig tree{.max_depth = 15, .min_samples_split = 10, .min_samples_leaf = 1, .max_features = 1.0};
  double sample_ratio = 1.0; // bootstrap size relative to the training set
  uint32_t seed = 42;
};

// Bagged regression trees; the "stable" half of the ensemble.
class RandomForestRegressor : public Regressor
{
public:
  explicit RandomForestRegressor(const ForestConfig &c = {});

  void fit(const FeatureMatrix &X, const std::vector<double> &y) override;
  double predict_row(const double *x, size_t n) const override;

  std::string kind() const override { return "random_forest"; }
  size_t n_features() const override { return n_features_; }
  bool fitted() const override { return !trees_.empty(); }
  std::vector<double> feature_importance() const override { return importance_; }

  nlohmann::json to_json() const override;
  static std::unique_ptr<RandomForestRegressor> from_json(const nlohmann::json &j);

  [[nodiscard]] size_t tree_count() const { return trees_.size(); }

private:
  ForestConfig cfg_;
  size_t n_features_ = 0;
  std::vector<RegressionTree> trees_;
  std::vector<double> importance_;
};
