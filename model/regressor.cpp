// model/regressor.cpp
#include "model/regressor.h"
#include "model/boosting.h"
#include "model/forest.h"

void Regressor::predict_batch(const FeatureMatrix &X, std::vector<double> &out) const
{
  if (!fitted())
    throw ModelNotLoadedError(kind() + " is not fitted");
  if (X.rows > 0 && X.cols != n_features())
    throw FeatureShapeError(n_features(), X.cols);
  out.resize(X.rows);

  // Shape and fit state are checked above; predict_row cannot throw here.
#pragma omp parallel for schedule(static)
  for (long i = 0; i < static_cast<long>(X.rows); ++i)
    out[static_cast<size_t>(i)] = predict_row(X.row(static_cast<size_t>(i)), X.cols);
}

std::unique_ptr<Regressor> regressor_from_json(const nlohmann::json &j)
{
  if (!j.is_object() || !j.contains("kind"))
    throw ModelArtifactError("regressor state has no kind tag");
  const auto kind = j.at("kind").get<std::string>();
  if (kind == "random_forest")
    return RandomForestRegressor::from_json(j);
  if (kind == "gradient_boosting")
    return GradientBoostingRegressor::from_json(j);
  throw ModelArtifactError("unknown regressor kind '" + kind + "'");
}
