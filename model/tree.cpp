// model/tree.cpp
#include "model/tree.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace
{
  constexpr double kMinGain = 1e-12;
}

void RegressionTree::fit(const FeatureMatrix &X, const std::vector<double> &y,
                         std::vector<size_t> idx, std::mt19937 &rng, std::vector<double> &importance)
{
  nodes_.clear();
  if (idx.empty())
    return;
  if (importance.size() < X.cols)
    importance.resize(X.cols, 0.0);
  build(X, y, idx, 0, idx.size(), 0, rng, importance);
}

int RegressionTree::build(const FeatureMatrix &X, const std::vector<double> &y,
                          std::vector<size_t> &idx, size_t begin, size_t end, int depth,
                          std::mt19937 &rng, std::vector<double> &importance)
{
  const size_t n = end - begin;
  double sum = 0.0;
  for (size_t i = begin; i < end; ++i)
    sum += y[idx[i]];

  TreeNode node;
  node.value = sum / static_cast<double>(n);

  const size_t min_leaf = static_cast<size_t>(std::max(1, cfg_.min_samples_leaf));
  if (depth >= cfg_.max_depth || n < static_cast<size_t>(std::max(2, cfg_.min_samples_split)) || n < 2 * min_leaf)
  {
    nodes_.push_back(node); // leaf
    return static_cast<int>(nodes_.size()) - 1;
  }

  std::vector<int> feats(X.cols);
  std::iota(feats.begin(), feats.end(), 0);
  if (cfg_.max_features < 1.0)
  {
    const size_t k = std::max<size_t>(1, static_cast<size_t>(std::lround(cfg_.max_features * X.cols)));
    std::shuffle(feats.begin(), feats.end(), rng);
    feats.resize(std::min(k, feats.size()));
  }

  const double parent = sum * sum / static_cast<double>(n);
  int best_f = -1;
  double best_thr = 0.0, best_gain = kMinGain;

  std::vector<std::pair<double, double>> xs;
  xs.reserve(n);
  for (int f : feats)
  {
    xs.clear();
    for (size_t i = begin; i < end; ++i)
      xs.emplace_back(X.at(idx[i], static_cast<size_t>(f)), y[idx[i]]);
    std::sort(xs.begin(), xs.end(),
              [](const auto &a, const auto &b) { return a.first < b.first; });
    if (xs.front().first == xs.back().first)
      continue; // constant column in this node

    double sl = 0.0;
    for (size_t k = 0; k + 1 < n; ++k)
    {
      sl += xs[k].second;
      if (xs[k].first == xs[k + 1].first)
        continue;
      const size_t nl = k + 1, nr = n - nl;
      if (nl < min_leaf || nr < min_leaf)
        continue;
      const double sr = sum - sl;
      const double gain = sl * sl / static_cast<double>(nl) + sr * sr / static_cast<double>(nr) - parent;
      if (gain > best_gain)
      {
        best_gain = gain;
        best_f = f;
        best_thr = 0.5 * (xs[k].first + xs[k + 1].first);
      }
    }
  }

  if (best_f == -1)
  {
    nodes_.push_back(node); // could not split -> leaf
    return static_cast<int>(nodes_.size()) - 1;
  }

  auto first = idx.begin() + static_cast<std::ptrdiff_t>(begin);
  auto last = idx.begin() + static_cast<std::ptrdiff_t>(end);
  auto mid_it = std::partition(first, last, [&](size_t r)
                               { return X.at(r, static_cast<size_t>(best_f)) < best_thr; });
  const size_t mid = static_cast<size_t>(mid_it - idx.begin());
  if (mid == begin || mid == end)
  {
    nodes_.push_back(node);
    return static_cast<int>(nodes_.size()) - 1;
  }

  importance[static_cast<size_t>(best_f)] += best_gain;
  node.feat = best_f;
  node.thr = best_thr;
  const int self = static_cast<int>(nodes_.size());
  nodes_.push_back(node); // placeholder, children patched below

  const int l = build(X, y, idx, begin, mid, depth + 1, rng, importance);
  const int r = build(X, y, idx, mid, end, depth + 1, rng, importance);
  nodes_[self].left = l;
  nodes_[self].right = r;
  return self;
}

double RegressionTree::predict(const double *x) const
{
  if (nodes_.empty())
    return 0.0;
  int id = 0;
  while (nodes_[id].feat != -1)
    id = (x[nodes_[id].feat] < nodes_[id].thr) ? nodes_[id].left : nodes_[id].right;
  return nodes_[id].value;
}

nlohmann::json RegressionTree::to_json() const
{
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &n : nodes_)
    arr.push_back({n.feat, n.left, n.right, n.thr, n.value});
  return arr;
}

void RegressionTree::from_json(const nlohmann::json &j, size_t n_features)
{
  if (!j.is_array())
    throw ModelArtifactError("tree state is not an array");
  nodes_.clear();
  nodes_.reserve(j.size());
  const int count = static_cast<int>(j.size());
  for (const auto &e : j)
  {
    if (!e.is_array() || e.size() != 5)
      throw ModelArtifactError("malformed tree node");
    TreeNode n;
    n.feat = e[0].get<int>();
    n.left = e[1].get<int>();
    n.right = e[2].get<int>();
    n.thr = e[3].get<double>();
    n.value = e[4].get<double>();
    // children always come after their parent (preorder layout)
    const int self = static_cast<int>(nodes_.size());
    if (n.feat < -1 || n.feat >= static_cast<int>(n_features))
      throw ModelArtifactError("tree node " + std::to_string(self) + " splits on feature " +
                               std::to_string(n.feat) + " of " + std::to_string(n_features));
    if (n.feat == -1 && (n.left != -1 || n.right != -1))
      throw ModelArtifactError("tree leaf " + std::to_string(self) + " has children");
    if (n.feat >= 0 && (n.left <= self || n.left >= count || n.right <= self || n.right >= count))
      throw ModelArtifactError("tree node " + std::to_string(self) + " child out of range");
    nodes_.push_back(n);
  }
  if (nodes_.empty())
    throw ModelArtifactError("tree has no nodes");
}
