// model/regressor.h
#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/schema.h"

// Dense row-major design matrix.
struct FeatureMatrix
{
  size_t rows = 0;
  size_t cols = 0;
  std::vector<double> data;

  FeatureMatrix() = default;
  FeatureMatrix(size_t r, size_t c) : rows(r), cols(c), data(r * c, 0.0) {}

  const double *row(size_t i) const { return data.data() + i * cols; }
  double *row(size_t i) { return data.data() + i * cols; }
  double at(size_t i, size_t j) const { return data[i * cols + j]; }

  void push_row(const std::vector<double> &r)
  {
    if (rows == 0 && cols == 0)
      cols = r.size();
    if (r.size() != cols)
      throw FeatureShapeError(cols, r.size());
    data.insert(data.end(), r.begin(), r.end());
    ++rows;
  }
};

// Opaque trainable model: fit once, then predict from any thread.
class Regressor
{
public:
  virtual ~Regressor() = default;

  virtual void fit(const FeatureMatrix &X, const std::vector<double> &y) = 0;
  // Throws FeatureShapeError when n differs from the fitted width.
  virtual double predict_row(const double *x, size_t n) const = 0;
  virtual void predict_batch(const FeatureMatrix &X, std::vector<double> &out) const;

  [[nodiscard]] virtual std::string kind() const = 0;
  [[nodiscard]] virtual size_t n_features() const = 0;
  [[nodiscard]] virtual bool fitted() const = 0;
  // Total split gain per feature, normalized to sum 1 (all zero if unfitted).
  [[nodiscard]] virtual std::vector<double> feature_importance() const = 0;

  [[nodiscard]] virtual nlohmann::json to_json() const = 0;
};

// Rebuilds a regressor from to_json() output, dispatching on "kind".
// Throws ModelArtifactError for unknown kinds or malformed state.
std::unique_ptr<Regressor> regressor_from_json(const nlohmann::json &j);
