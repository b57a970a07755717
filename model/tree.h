// model/tree.h
#pragma once
#include <cstdint>
#include <random>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/regressor.h"

struct TreeConfig
{
  int max_depth = 15;
  int min_samples_split = 10;
  int min_samples_leaf = 1;
  double max_features = 1.0; // fraction of columns tried per split
};

struct TreeNode
{
  int feat = -1; // -1 = leaf
  int left = -1;
  int right = -1;
  double thr = 0.0;
  double value = 0.0; // leaf mean
};

// CART regression tree, variance-reduction splits over sorted sweeps.
class RegressionTree
{
public:
  RegressionTree() = default;
  explicit RegressionTree(const TreeConfig &c) : cfg_(c) {}

  // Fits on the rows listed in idx (duplicates allowed, for bootstraps).
  // Split gains are added into importance (size X.cols).
  void fit(const FeatureMatrix &X, const std::vector<double> &y,
           std::vector<size_t> idx, std::mt19937 &rng, std::vector<double> &importance);

  [[nodiscard]] double predict(const double *x) const;
  [[nodiscard]] size_t node_count() const { return nodes_.size(); }
  [[nodiscard]] bool empty() const { return nodes_.empty(); }

  nlohmann::json to_json() const;
  void from_json(const nlohmann::json &j, size_t n_features);

private:
  TreeConfig cfg_;
  std::vector<TreeNode> nodes_;

  int build(const FeatureMatrix &X, const std::vector<double> &y,
            std::vector<size_t> &idx, size_t begin, size_t end, int depth,
            std::mt19937 &rng, std::vector<double> &importance);
};
