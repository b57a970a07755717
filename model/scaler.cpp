// model/scaler.cpp
#include "model/scaler.h"
#include <cmath>
#include <utility>

FeatureScaler::FeatureScaler(std::vector<double> mean, std::vector<double> scale)
    : mean_(std::move(mean)), scale_(std::move(scale))
{
  if (mean_.size() != scale_.size())
    throw ModelArtifactError("scaler mean/scale length mismatch");
  for (double s : scale_)
    if (!(s > 0.0) || !std::isfinite(s))
      throw ModelArtifactError("scaler has a non-positive scale");
}

void FeatureScaler::fit(const FeatureMatrix &X)
{
  mean_.assign(X.cols, 0.0);
  scale_.assign(X.cols, 1.0);
  if (X.rows == 0)
    return;

  for (size_t i = 0; i < X.rows; ++i)
  {
    const double *r = X.row(i);
    for (size_t j = 0; j < X.cols; ++j)
      mean_[j] += r[j];
  }
  for (auto &m : mean_)
    m /= static_cast<double>(X.rows);

  std::vector<double> var(X.cols, 0.0);
  for (size_t i = 0; i < X.rows; ++i)
  {
    const double *r = X.row(i);
    for (size_t j = 0; j < X.cols; ++j)
    {
      const double d = r[j] - mean_[j];
      var[j] += d * d;
    }
  }
  for (size_t j = 0; j < X.cols; ++j)
  {
    const double sd = std::sqrt(var[j] / static_cast<double>(X.rows));
    scale_[j] = sd > 1e-12 ? sd : 1.0;
  }
}

std::vector<double> FeatureScaler::transform(const std::vector<double> &row) const
{
  if (!fitted())
    throw ModelNotLoadedError("feature scaler is not fitted");
  if (row.size() != mean_.size())
    throw FeatureShapeError(mean_.size(), row.size());
  std::vector<double> out(row.size());
  for (size_t j = 0; j < row.size(); ++j)
    out[j] = (row[j] - mean_[j]) / scale_[j];
  return out;
}

void FeatureScaler::transform_inplace(FeatureMatrix &X) const
{
  if (!fitted())
    throw ModelNotLoadedError("feature scaler is not fitted");
  if (X.rows > 0 && X.cols != mean_.size())
    throw FeatureShapeError(mean_.size(), X.cols);

#pragma omp parallel for schedule(static)
  for (long i = 0; i < static_cast<long>(X.rows); ++i)
  {
    double *r = X.row(static_cast<size_t>(i));
    for (size_t j = 0; j < X.cols; ++j)
      r[j] = (r[j] - mean_[j]) / scale_[j];
  }
}

nlohmann::json FeatureScaler::to_json() const
{
  return {{"mean", mean_}, {"scale", scale_}};
}

FeatureScaler FeatureScaler::from_json(const nlohmann::json &j)
{
  return FeatureScaler(j.at("mean").get<std::vector<double>>(),
                       j.at("scale").get<std::vector<double>>());
}
