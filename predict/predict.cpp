// predict/predict.cpp
#include "predict/predict.h"
#include <algorithm>
#include <cmath>
#include <utility>
#include "common/log.h"

EnsemblePredictor::EnsemblePredictor(const PredConfig &c) : cfg_(c) {}

void EnsemblePredictor::load(ModelSnapshot m)
{
  if (!m || !m->complete())
    throw ModelArtifactError("refusing to load an incomplete model");
  const std::string id = m->model_id;
  ModelSnapshot prev = model_.exchange(std::move(m), std::memory_order_acq_rel);
  if (prev)
    LOG_INFO("ensemble: swapped model %s -> %s", prev->model_id.c_str(), id.c_str());
  else
    LOG_INFO("ensemble: loaded model %s", id.c_str());
}

void EnsemblePredictor::unload()
{
  model_.store(nullptr, std::memory_order_release);
}

EnsemblePrediction EnsemblePredictor::predict(const FeatureVector &fv) const
{
  const ModelSnapshot m = snapshot();
  if (!m)
    throw ModelNotLoadedError();
  return predict(fv, *m);
}

EnsemblePrediction EnsemblePredictor::predict(const FeatureVector &fv, const TrainedModel &m) const
{
  if (!m.stable || !m.reactive)
    throw ModelNotLoadedError("model '" + m.model_id + "' is missing a regressor");
  if (fv.size() != m.feature_names.size())
    throw FeatureShapeError(m.feature_names.size(), fv.size());

  const std::vector<double> x = m.scaler.transform(fv.f);

  EnsemblePrediction p;
  p.stable_output = m.stable->predict_row(x.data(), x.size());
  p.reactive_output = m.reactive->predict_row(x.data(), x.size());

  double c = 0.5 * (p.stable_output + p.reactive_output);
  if (!std::isfinite(c))
    c = kCongestionMin;
  p.congestion = std::clamp(c, kCongestionMin, kCongestionMax);

  // Disagreement between the two models lowers confidence.
  const double agreement = std::abs(p.stable_output - p.reactive_output);
  const double conf = std::isfinite(agreement) ? cfg_.confidence_ceiling - agreement : cfg_.confidence_floor;
  p.confidence_pct = std::clamp(conf, cfg_.confidence_floor, cfg_.confidence_ceiling);
  return p;
}

SpeedEstimate EnsemblePredictor::estimate_speed(double congestion, double free_flow_speed) const
{
  const double c = std::clamp(congestion, kCongestionMin, kCongestionMax) / 100.0;
  const double reduction = c * cfg_.max_speed_reduction;
  return SpeedEstimate{free_flow_speed * (1.0 - reduction), reduction * 100.0};
}

std::map<std::string, double> EnsemblePredictor::feature_importance() const
{
  const ModelSnapshot m = snapshot();
  if (!m)
    return {};
  return m->feature_importance();
}

ModelInfo EnsemblePredictor::model_info() const
{
  ModelInfo info;
  const ModelSnapshot m = snapshot();
  if (!m)
    return info;
  info.loaded = true;
  info.model_id = m->model_id;
  info.version = m->version;
  info.created_at = m->created_at;
  info.feature_names = m->feature_names;
  info.stable_kind = m->stable ? m->stable->kind() : "";
  info.reactive_kind = m->reactive ? m->reactive->kind() : "";
  info.metrics = m->metrics;
  return info;
}
