// model/forest.cpp
#include "model/forest.h"
#include <algorithm>
#include <numeric>
#include "common/log.h"
#include "common/timers.h"

namespace
{
  void normalize(std::vector<double> &v)
  {
    const double total = std::accumulate(v.begin(), v.end(), 0.0);
    if (total <= 0.0)
      return;
    for (auto &x : v)
      x /= total;
  }
}

RandomForestRegressor::RandomForestRegressor(const ForestConfig &c) : cfg_(c) {}

void RandomForestRegressor::fit(const FeatureMatrix &X, const std::vector<double> &y)
{
  if (X.rows == 0 || X.rows != y.size())
    throw TrainingDataInsufficient("random forest: empty or mismatched training set");

  const uint64_t t0 = now_ms();
  const int T = std::max(1, cfg_.trees);
  n_features_ = X.cols;
  trees_.assign(static_cast<size_t>(T), RegressionTree(cfg_.tree));

  // Per-tree importances, summed after the parallel section.
  std::vector<std::vector<double>> imp(static_cast<size_t>(T), std::vector<double>(X.cols, 0.0));
  const size_t m = std::max<size_t>(1, static_cast<size_t>(cfg_.sample_ratio * static_cast<double>(X.rows)));

#pragma omp parallel for schedule(dynamic)
  for (int t = 0; t < T; ++t)
  {
    std::mt19937 rng_local(cfg_.seed + static_cast<uint32_t>(t));
    std::uniform_int_distribution<size_t> uni(0, X.rows - 1);

    std::vector<size_t> boot(m);
    for (size_t i = 0; i < m; ++i)
      boot[i] = uni(rng_local);

    trees_[static_cast<size_t>(t)].fit(X, y, std::move(boot), rng_local, imp[static_cast<size_t>(t)]);
  }

  importance_.assign(X.cols, 0.0);
  for (const auto &v : imp)
    for (size_t k = 0; k < X.cols; ++k)
      importance_[k] += v[k];
  normalize(importance_);

  LOG_INFO("random forest: %d trees on %zu rows in %llums", T, X.rows,
           static_cast<unsigned long long>(now_ms() - t0));
}

double RandomForestRegressor::predict_row(const double *x, size_t n) const
{
  if (trees_.empty())
    throw ModelNotLoadedError("random forest is not fitted");
  if (n != n_features_)
    throw FeatureShapeError(n_features_, n);
  double s = 0.0;
  for (const auto &tr : trees_)
    s += tr.predict(x);
  return s / static_cast<double>(trees_.size());
}

nlohmann::json RandomForestRegressor::to_json() const
{
  nlohmann::json trees = nlohmann::json::array();
  for (const auto &tr : trees_)
    trees.push_back(tr.to_json());
  return {{"kind", kind()},
          {"n_features", n_features_},
          {"config", {{"trees", cfg_.trees}, {"max_depth", cfg_.tree.max_depth},
                      {"min_samples_split", cfg_.tree.min_samples_split},
                      {"min_samples_leaf", cfg_.tree.min_samples_leaf},
                      {"max_features", cfg_.tree.max_features},
                      {"sample_ratio", cfg_.sample_ratio}, {"seed", cfg_.seed}}},
          {"importance", importance_},
          {"trees", std::move(trees)}};
}

std::unique_ptr<RandomForestRegressor> RandomForestRegressor::from_json(const nlohmann::json &j)
{
  ForestConfig c;
  const auto &jc = j.at("config");
  c.trees = jc.at("trees").get<int>();
  c.tree.max_depth = jc.at("max_depth").get<int>();
  c.tree.min_samples_split = jc.at("min_samples_split").get<int>();
  c.tree.min_samples_leaf = jc.at("min_samples_leaf").get<int>();
  c.tree.max_features = jc.at("max_features").get<double>();
  c.sample_ratio = jc.at("sample_ratio").get<double>();
  c.seed = jc.at("seed").get<uint32_t>();

  auto rf = std::make_unique<RandomForestRegressor>(c);
  rf->n_features_ = j.at("n_features").get<size_t>();
  rf->importance_ = j.at("importance").get<std::vector<double>>();
  for (const auto &jt : j.at("trees"))
  {
    RegressionTree tr(c.tree);
    tr.from_json(jt, rf->n_features_);
    rf->trees_.push_back(std::move(tr));
  }
  if (rf->trees_.empty() || rf->importance_.size() != rf->n_features_)
    throw ModelArtifactError("random forest state is incomplete");
  return rf;
}
