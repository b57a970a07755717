// tests/test_util.h
#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include "common/schema.h"
#include "common/timers.h"
#include "model/bundle.h"
#include "model/regressor.h"
#include "train/train.h"

// 2024-01-01T00:00:00Z, a Monday.
inline constexpr EpochSeconds kMonday2024 = 1704067200;

// Regressor whose output is any function of the (scaled) row.
class StubRegressor : public Regressor
{
public:
  using Fn = std::function<double(const double *, size_t)>;

  explicit StubRegressor(Fn fn, size_t width = kNumFeatures) : fn_(std::move(fn)), width_(width) {}

  void fit(const FeatureMatrix &, const std::vector<double> &) override {}
  double predict_row(const double *x, size_t n) const override
  {
    if (n != width_)
      throw FeatureShapeError(width_, n);
    return fn_(x, n);
  }

  std::string kind() const override { return "stub"; }
  size_t n_features() const override { return width_; }
  bool fitted() const override { return true; }
  std::vector<double> feature_importance() const override
  {
    std::vector<double> v(width_, 0.0);
    v[F_HOUR] = 1.0;
    return v;
  }
  nlohmann::json to_json() const override { return {{"kind", "stub"}}; }

private:
  Fn fn_;
  size_t width_;
};

inline StubRegressor::Fn constant(double v)
{
  return [v](const double *, size_t) { return v; };
}

// Model with an identity scaler, so stubs see raw feature values.
inline std::shared_ptr<TrainedModel> stub_model(StubRegressor::Fn stable,
                                                StubRegressor::Fn reactive,
                                                const std::string &id = "stub-model")
{
  auto m = std::make_shared<TrainedModel>();
  m->model_id = id;
  m->feature_names = feature_name_list();
  m->scaler = FeatureScaler(std::vector<double>(kNumFeatures, 0.0), std::vector<double>(kNumFeatures, 1.0));
  if (stable)
    m->stable = std::make_unique<StubRegressor>(std::move(stable));
  if (reactive)
    m->reactive = std::make_unique<StubRegressor>(std::move(reactive));
  return m;
}

// Small enough to train in well under a second.
inline TrainConfig tiny_train_config()
{
  TrainConfig c;
  c.forest.trees = 8;
  c.forest.tree.max_depth = 8;
  c.boost.rounds = 20;
  return c;
}

inline TrainConfig small_train_config()
{
  TrainConfig c;
  c.forest.trees = 30;
  c.forest.tree.max_depth = 10;
  c.boost.rounds = 60;
  return c;
}

// Settable wall clock for TTL / cooldown tests.
struct FakeClock
{
  EpochSeconds now = kMonday2024;

  WallClock fn()
  {
    return [this] { return now; };
  }
  void advance(EpochSeconds s) { now += s; }
};

// Unique scratch directory removed on destruction.
class TempDir
{
public:
  TempDir()
  {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("tf-test-" + std::to_string(rd()) + "-" + std::to_string(now_ms()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  std::string file(const std::string &name) const { return (path_ / name).string(); }
  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline Observation observation_at(const std::string &loc, EpochSeconds ts, int level, double speed)
{
  Observation o;
  o.location_id = loc;
  o.ts = ts;
  o.congestion_level = level;
  o.average_speed = speed;
  return o;
}
