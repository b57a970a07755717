// train/train.cpp
#include "train/train.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <numeric>
#include <random>
#include "common/log.h"
#include "common/timers.h"

namespace
{
  constexpr double kNoiseSigma = 5.0;
  constexpr double kWeekendFactor = 0.7;
  constexpr double kHolidayRate = 0.03;
  constexpr double kIncidentRate = 0.05;
  constexpr double kEventRate = 0.08;

  // Base congestion (percent) by hour of day.
  double hour_prior(int hour, std::mt19937 &rng)
  {
    std::uniform_real_distribution<double> u(0.0, 1.0);
    if (hour >= 7 && hour <= 9)
      return 60.0 + u(rng) * 30.0;
    if (hour >= 17 && hour <= 19)
      return 65.0 + u(rng) * 30.0;
    if (hour >= 11 && hour <= 14)
      return 35.0 + u(rng) * 25.0;
    if (hour >= 22 || hour <= 5)
      return 5.0 + u(rng) * 20.0;
    return 25.0 + u(rng) * 25.0;
  }

  std::string next_model_id(EpochSeconds created)
  {
    static std::atomic<uint32_t> seq{0};
    return "ensemble-" + format_hour_key(created) + "-" + std::to_string(seq.fetch_add(1) + 1);
  }
} // namespace

TrainingData generate_synthetic(size_t n, uint32_t seed)
{
  TrainingData d;
  d.rows.reserve(n);
  d.labels.reserve(n);

  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> hour_d(0, 23);
  std::uniform_int_distribution<int> dow_d(0, 6);
  std::uniform_int_distribution<int> level_d(kLevelMin, kLevelMax);
  std::uniform_real_distribution<double> u(0.0, 1.0);
  std::normal_distribution<double> temp_d(18.0, 8.0);
  std::normal_distribution<double> noise(0.0, kNoiseSigma);

  for (size_t i = 0; i < n; ++i)
  {
    const int hour = hour_d(rng);
    const int dow = dow_d(rng);
    const bool weekend = dow >= 5;
    const bool holiday = u(rng) < kHolidayRate;
    const double precip = u(rng) < 0.8 ? 0.0 : u(rng) * 12.0;
    const double visibility = precip > 6.0 ? 2.0 + u(rng) * 4.0 : 8.0 + u(rng) * 4.0;
    const bool incident = u(rng) < kIncidentRate;
    const bool event = u(rng) < kEventRate;

    double c = hour_prior(hour, rng);
    if (weekend || holiday)
      c *= kWeekendFactor;
    c += precip * 0.8;
    if (incident)
      c += 12.0;
    if (event)
      c += 6.0;

    const int lag1 = level_d(rng);
    const int lag3 = level_d(rng);
    const int lag24 = level_d(rng);
    c += (lag1 - 3) * 1.5;

    // Weak effects only; time of day carries most of the signal.
    const double vehicles = 60.0 + u(rng) * 120.0;
    const double speed = 30.0 + u(rng) * 40.0;
    const double free_flow = 50.0 + u(rng) * 30.0;
    c += (vehicles - 120.0) * 0.05;
    c -= (speed - 50.0) * 0.1;

    const double label = std::clamp(c + noise(rng), kCongestionMin, kCongestionMax);

    FeatureVector fv;
    fv.f.assign(kNumFeatures, 0.0);
    fv[F_HOUR] = hour;
    fv[F_DOW] = dow;
    fv[F_WEEKEND] = weekend ? 1.0 : 0.0;
    fv[F_HOLIDAY] = holiday ? 1.0 : 0.0;
    fv[F_TEMPERATURE] = temp_d(rng);
    fv[F_PRECIPITATION] = precip;
    fv[F_VISIBILITY] = visibility;
    fv[F_VEHICLE_COUNT] = std::round(vehicles);
    fv[F_AVG_SPEED] = speed;
    fv[F_INCIDENT] = incident ? 1.0 : 0.0;
    fv[F_EVENT] = event ? 1.0 : 0.0;
    fv[F_LAG_1H] = lag1;
    fv[F_LAG_3H] = lag3;
    fv[F_LAG_24H] = lag24;
    fv[F_SPEED_LAG_1H] = free_flow * (1.0 - percent_from_level(lag1) / 100.0 * 0.6);

    d.rows.push_back(std::move(fv));
    d.labels.push_back(label);
  }
  return d;
}

TrainingData HistoricalDataSource::load()
{
  TrainingData d;
  for (const auto &loc : obs_.locations())
  {
    std::vector<Observation> hist = obs_.history(loc, history_hours_);
    std::reverse(hist.begin(), hist.end()); // oldest -> newest

    // Row i: features from everything up to hist[i-1], label from hist[i].
    for (size_t i = 1; i < hist.size(); ++i)
    {
      const Observation &target = hist[i];
      if (!target.congestion_level)
        continue;
      const size_t begin = i > kMaxWindow ? i - kMaxWindow : 0;
      const std::vector<Observation> window(hist.begin() + static_cast<long>(begin),
                                            hist.begin() + static_cast<long>(i));
      d.rows.push_back(fb_.build(hist[i - 1], target.ts, window));
      d.labels.push_back(percent_from_level(*target.congestion_level));
    }
  }
  LOG_INFO("historical source: %zu rows from %zu locations", d.size(), obs_.locations().size());
  return d;
}

std::unique_ptr<TrainingDataSource> make_training_source(const std::string &kind,
                                                         size_t synthetic_samples,
                                                         uint32_t seed,
                                                         const ObservationSource *obs,
                                                         const FeatureBuilder &fb)
{
  if (kind == "synthetic")
    return std::make_unique<SyntheticDataSource>(synthetic_samples, seed);
  if (kind == "historical")
  {
    if (!obs)
      throw InvalidRequestError("historical training source needs an observation store");
    return std::make_unique<HistoricalDataSource>(*obs, fb);
  }
  throw InvalidRequestError("unknown training source '" + kind + "'");
}

TrainingPipeline::TrainingPipeline(const TrainConfig &c) : cfg_(c) {}

TrainResult TrainingPipeline::train(const std::vector<FeatureVector> &rows,
                                    const std::vector<double> &labels) const
{
  if (rows.size() != labels.size())
    throw TrainingDataInsufficient("training rows (" + std::to_string(rows.size()) +
                                   ") and labels (" + std::to_string(labels.size()) + ") disagree");
  if (rows.size() < cfg_.min_samples)
    throw TrainingDataInsufficient(rows.size(), cfg_.min_samples);
  for (const auto &r : rows)
    if (r.size() != kNumFeatures)
      throw FeatureShapeError(kNumFeatures, r.size());

  const uint64_t t0 = now_ms();
  const size_t n = rows.size();

  std::vector<size_t> order(n);
  std::iota(order.begin(), order.end(), size_t{0});
  std::mt19937 rng(cfg_.seed);
  std::shuffle(order.begin(), order.end(), rng);

  const double frac = std::clamp(cfg_.holdout_fraction, 0.0, 0.5);
  size_t n_test = static_cast<size_t>(std::ceil(static_cast<double>(n) * frac - 1e-9));
  n_test = std::min(n_test, n - 1);
  const size_t n_train = n - n_test;

  FeatureMatrix X_train, X_test;
  X_train.cols = X_test.cols = kNumFeatures;
  X_train.data.reserve(n_train * kNumFeatures);
  X_test.data.reserve(n_test * kNumFeatures);
  std::vector<double> y_train, y_test;
  y_train.reserve(n_train);
  y_test.reserve(n_test);
  for (size_t k = 0; k < n; ++k)
  {
    const size_t i = order[k];
    if (k < n_test)
    {
      X_test.push_row(rows[i].f);
      y_test.push_back(labels[i]);
    }
    else
    {
      X_train.push_row(rows[i].f);
      y_train.push_back(labels[i]);
    }
  }

  // Scaler statistics come from the train split only.
  FeatureScaler scaler;
  scaler.fit(X_train);
  BatchStandardizer standardizer(cfg_.scaler);
  standardizer.apply(scaler, X_train);
  standardizer.apply(scaler, X_test);

  auto stable = std::make_unique<RandomForestRegressor>(cfg_.forest);
  stable->fit(X_train, y_train);
  auto reactive = std::make_unique<GradientBoostingRegressor>(cfg_.boost);
  reactive->fit(X_train, y_train);

  TrainingMetrics m;
  m.train_rows = n_train;
  m.holdout_rows = n_test;
  if (n_test > 0)
  {
    std::vector<double> a, b;
    stable->predict_batch(X_test, a);
    reactive->predict_batch(X_test, b);

    double mean_y = 0.0;
    for (double y : y_test)
      mean_y += y;
    mean_y /= static_cast<double>(n_test);

    double sse = 0.0, sae = 0.0, sst = 0.0;
    for (size_t i = 0; i < n_test; ++i)
    {
      const double p = std::clamp(0.5 * (a[i] + b[i]), kCongestionMin, kCongestionMax);
      const double e = p - y_test[i];
      sse += e * e;
      sae += std::abs(e);
      sst += (y_test[i] - mean_y) * (y_test[i] - mean_y);
    }
    m.mse = sse / static_cast<double>(n_test);
    m.rmse = std::sqrt(m.mse);
    m.mae = sae / static_cast<double>(n_test);
    m.r2 = sst > 0.0 ? 1.0 - sse / sst : 0.0;
  }

  auto model = std::make_shared<TrainedModel>();
  model->created_at = system_now();
  model->model_id = next_model_id(model->created_at);
  model->feature_names = feature_name_list();
  model->scaler = std::move(scaler);
  model->stable = std::move(stable);
  model->reactive = std::move(reactive);
  model->metrics = m;

  LOG_INFO("trained %s on %zu rows (holdout %zu): rmse=%.2f mae=%.2f r2=%.3f in %llums",
           model->model_id.c_str(), n_train, n_test, m.rmse, m.mae, m.r2,
           static_cast<unsigned long long>(now_ms() - t0));
  return TrainResult{std::move(model), m};
}

ModelSnapshot TrainingPipeline::retrain_and_swap(EnsemblePredictor &pred,
                                                 TrainingDataSource &src,
                                                 const std::string &path) const
{
  const ModelSnapshot previous = pred.snapshot();
  try
  {
    TrainResult r = train(src.load());
    if (!path.empty())
      save_bundle(*r.model, path);
    pred.load(r.model);
    return r.model;
  }
  catch (const std::exception &e)
  {
    LOG_ERROR("retrain from %s source failed, keeping %s: %s", src.name().c_str(),
              previous ? previous->model_id.c_str() : "no model", e.what());
    throw;
  }
}

ModelSnapshot TrainingPipeline::load_or_bootstrap(EnsemblePredictor &pred,
                                                  TrainingDataSource &src,
                                                  const std::string &path) const
{
  if (!path.empty())
  {
    try
    {
      ModelSnapshot m = load_bundle(path);
      pred.load(m);
      return m;
    }
    catch (const ForecastError &e)
    {
      LOG_WARN("no usable bundle (%s), training from %s source", e.what(), src.name().c_str());
    }
  }

  TrainResult r = train(src.load());
  if (!path.empty())
  {
    try
    {
      save_bundle(*r.model, path);
    }
    catch (const ModelArtifactError &e)
    {
      LOG_ERROR("bootstrap model %s not persisted: %s", r.model->model_id.c_str(), e.what());
    }
  }
  pred.load(r.model);
  return r.model;
}
