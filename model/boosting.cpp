// model/boosting.cpp
#include "model/boosting.h"
#include <LightGBM/c_api.h>
#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include "common/log.h"
#include "common/timers.h"

namespace
{
  constexpr int64_t kModelBufferBytes = 1 << 16;

  // LightGBM reports failures as a nonzero return plus a thread-local message.
  template <typename Error = std::runtime_error>
  void lgbm_check(int rc, const char *what)
  {
    if (rc != 0)
      throw Error(std::string("LightGBM ") + what + ": " + LGBM_GetLastError());
  }

  std::string export_model(BoosterHandle b)
  {
    std::string buf(static_cast<size_t>(kModelBufferBytes), '\0');
    int64_t len = 0;
    lgbm_check(LGBM_BoosterSaveModelToString(b, 0, -1, C_API_FEATURE_IMPORTANCE_GAIN, kModelBufferBytes, &len,
                                             buf.data()),
               "model export");
    if (len > kModelBufferBytes)
    {
      buf.assign(static_cast<size_t>(len), '\0');
      lgbm_check(LGBM_BoosterSaveModelToString(b, 0, -1, C_API_FEATURE_IMPORTANCE_GAIN, len, &len, buf.data()),
                 "model export");
    }
    buf.resize(len > 0 ? static_cast<size_t>(len - 1) : 0); // len counts the trailing NUL
    return buf;
  }

  struct DatasetGuard
  {
    DatasetHandle h = nullptr;
    ~DatasetGuard()
    {
      if (h)
        LGBM_DatasetFree(h);
    }
  };

  struct BoosterGuard
  {
    BoosterHandle h = nullptr;
    ~BoosterGuard()
    {
      if (h)
        LGBM_BoosterFree(h);
    }
  };
} // namespace

GradientBoostingRegressor::GradientBoostingRegressor(const BoostConfig &c) : cfg_(c) {}

GradientBoostingRegressor::~GradientBoostingRegressor() { release(); }

void GradientBoostingRegressor::release()
{
  if (booster_)
    LGBM_BoosterFree(static_cast<BoosterHandle>(booster_));
  booster_ = nullptr;
  iterations_ = 0;
}

std::string GradientBoostingRegressor::booster_params() const
{
  std::ostringstream p;
  p << "boosting=gbdt objective=regression metric=l2 verbosity=-1"
    << " deterministic=true force_row_wise=true"
    << " learning_rate=" << cfg_.learning_rate
    << " num_leaves=" << cfg_.num_leaves
    << " max_depth=" << cfg_.max_depth
    << " min_data_in_leaf=" << cfg_.min_data_in_leaf
    << " seed=" << cfg_.seed;
  if (cfg_.subsample > 0.0 && cfg_.subsample < 1.0)
    p << " bagging_fraction=" << cfg_.subsample << " bagging_freq=1";
  if (cfg_.threads > 0)
    p << " num_threads=" << cfg_.threads;
  return p.str();
}

void GradientBoostingRegressor::fit(const FeatureMatrix &X, const std::vector<double> &y)
{
  if (X.rows == 0 || X.rows != y.size())
    throw TrainingDataInsufficient("gradient boosting: empty or mismatched training set");

  const uint64_t t0 = now_ms();
  release();

  DatasetGuard ds;
  lgbm_check(LGBM_DatasetCreateFromMat(X.data.data(), C_API_DTYPE_FLOAT64, static_cast<int32_t>(X.rows),
                                       static_cast<int32_t>(X.cols), 1, "verbosity=-1", nullptr, &ds.h),
             "dataset creation");
  const std::vector<float> label(y.begin(), y.end());
  lgbm_check(LGBM_DatasetSetField(ds.h, "label", label.data(), static_cast<int>(label.size()),
                                  C_API_DTYPE_FLOAT32),
             "label upload");

  BoosterGuard trainer;
  lgbm_check(LGBM_BoosterCreate(ds.h, booster_params().c_str(), &trainer.h), "booster creation");
  const int rounds = std::max(1, cfg_.rounds);
  int finished = 0;
  for (int it = 0; it < rounds && !finished; ++it)
    lgbm_check(LGBM_BoosterUpdateOneIter(trainer.h, &finished), "boosting round");

  // Serve from a booster parsed back from text, as a loaded bundle would be,
  // so the training dataset can be released.
  load_model_string(export_model(trainer.h), X.cols);

  LOG_INFO("gradient boosting: %d rounds on %zu rows (LightGBM), %llums", iterations_, X.rows,
           static_cast<unsigned long long>(now_ms() - t0));
}

void GradientBoostingRegressor::load_model_string(const std::string &model, size_t expected_features)
{
  BoosterGuard loaded;
  int iters = 0;
  lgbm_check<ModelArtifactError>(LGBM_BoosterLoadModelFromString(model.c_str(), &iters, &loaded.h),
                                 "model parse");
  int nf = 0;
  lgbm_check<ModelArtifactError>(LGBM_BoosterGetNumFeature(loaded.h, &nf), "feature count");
  if (nf < 0 || static_cast<size_t>(nf) != expected_features)
    throw FeatureShapeError(expected_features, nf < 0 ? 0 : static_cast<size_t>(nf));

  std::vector<double> gain(static_cast<size_t>(nf), 0.0);
  lgbm_check<ModelArtifactError>(LGBM_BoosterFeatureImportance(loaded.h, 0, C_API_FEATURE_IMPORTANCE_GAIN,
                                                               gain.data()),
                                 "feature importance");
  const double total = std::accumulate(gain.begin(), gain.end(), 0.0);
  if (total > 0.0)
    for (auto &v : gain)
      v /= total;

  release();
  booster_ = loaded.h;
  loaded.h = nullptr;
  n_features_ = expected_features;
  iterations_ = iters;
  importance_ = std::move(gain);
}

double GradientBoostingRegressor::predict_row(const double *x, size_t n) const
{
  if (!booster_)
    throw ModelNotLoadedError("gradient boosting is not fitted");
  if (n != n_features_)
    throw FeatureShapeError(n_features_, n);
  double out = 0.0;
  int64_t len = 0;
  lgbm_check(LGBM_BoosterPredictForMatSingleRow(static_cast<BoosterHandle>(booster_), x, C_API_DTYPE_FLOAT64,
                                                static_cast<int32_t>(n), 1, C_API_PREDICT_NORMAL, 0, -1,
                                                "num_threads=1", &len, &out),
             "prediction");
  return out;
}

void GradientBoostingRegressor::predict_batch(const FeatureMatrix &X, std::vector<double> &out) const
{
  if (!booster_)
    throw ModelNotLoadedError("gradient boosting is not fitted");
  if (X.rows > 0 && X.cols != n_features_)
    throw FeatureShapeError(n_features_, X.cols);
  out.assign(X.rows, 0.0);
  if (X.rows == 0)
    return;
  int64_t len = 0;
  lgbm_check(LGBM_BoosterPredictForMat(static_cast<BoosterHandle>(booster_), X.data.data(), C_API_DTYPE_FLOAT64,
                                       static_cast<int32_t>(X.rows), static_cast<int32_t>(X.cols), 1,
                                       C_API_PREDICT_NORMAL, 0, -1, "", &len, out.data()),
             "batch prediction");
}

nlohmann::json GradientBoostingRegressor::to_json() const
{
  if (!booster_)
    throw ModelArtifactError("gradient boosting is not fitted");
  return {{"kind", kind()},
          {"engine", "lightgbm"},
          {"n_features", n_features_},
          {"iterations", iterations_},
          {"config", {{"rounds", cfg_.rounds}, {"learning_rate", cfg_.learning_rate},
                      {"num_leaves", cfg_.num_leaves}, {"max_depth", cfg_.max_depth},
                      {"min_data_in_leaf", cfg_.min_data_in_leaf}, {"subsample", cfg_.subsample},
                      {"seed", cfg_.seed}}},
          {"model", export_model(static_cast<BoosterHandle>(booster_))}};
}

std::unique_ptr<GradientBoostingRegressor> GradientBoostingRegressor::from_json(const nlohmann::json &j)
{
  if (j.value("engine", std::string{}) != "lightgbm")
    throw ModelArtifactError("gradient boosting state is not a LightGBM model");

  BoostConfig c;
  const auto &jc = j.at("config");
  c.rounds = jc.at("rounds").get<int>();
  c.learning_rate = jc.at("learning_rate").get<double>();
  c.num_leaves = jc.at("num_leaves").get<int>();
  c.max_depth = jc.at("max_depth").get<int>();
  c.min_data_in_leaf = jc.at("min_data_in_leaf").get<int>();
  c.subsample = jc.at("subsample").get<double>();
  c.seed = jc.at("seed").get<uint32_t>();

  auto gb = std::make_unique<GradientBoostingRegressor>(c);
  gb->load_model_string(j.at("model").get<std::string>(), j.at("n_features").get<size_t>());
  return gb;
}
