// model/scaler.h
#pragma once
#include <cstddef>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/regressor.h"

// Per-column standardization, frozen after fit().
class FeatureScaler
{
public:
  FeatureScaler() = default;
  FeatureScaler(std::vector<double> mean, std::vector<double> scale);

  // Population mean / std per column; zero-variance columns get scale 1.
  void fit(const FeatureMatrix &X);

  [[nodiscard]] std::vector<double> transform(const std::vector<double> &row) const;
  void transform_inplace(FeatureMatrix &X) const;

  [[nodiscard]] bool fitted() const { return !mean_.empty(); }
  [[nodiscard]] size_t width() const { return mean_.size(); }
  [[nodiscard]] const std::vector<double> &mean() const { return mean_; }
  [[nodiscard]] const std::vector<double> &scale() const { return scale_; }

  nlohmann::json to_json() const;
  static FeatureScaler from_json(const nlohmann::json &j);

private:
  std::vector<double> mean_;
  std::vector<double> scale_;
};

struct ScalerConfig
{
  bool prefer_opencl = false;
  size_t min_rows_for_gpu = 4096; // smaller batches stay on the CPU
};

// Applies a fitted scaler to large matrices, on an OpenCL GPU when one is
// present and the build has OpenCL, otherwise on the CPU.
class BatchStandardizer
{
public:
  explicit BatchStandardizer(const ScalerConfig &c);
  ~BatchStandardizer();
  BatchStandardizer(const BatchStandardizer &) = delete;
  BatchStandardizer &operator=(const BatchStandardizer &) = delete;

  [[nodiscard]] bool has_opencl() const { return has_cl_; }

  void apply(const FeatureScaler &scaler, FeatureMatrix &X);

private:
  ScalerConfig cfg_;
  bool has_cl_ = false;

  // Minimal OpenCL context (opaque in header)
  struct ClCtx;
  ClCtx *cl_ = nullptr;

  static void release_ctx(ClCtx *c);
  void init_opencl_if_possible();
  bool gpu_apply(const FeatureScaler &scaler, FeatureMatrix &X);
};
