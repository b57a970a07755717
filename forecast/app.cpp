// forecast/app.cpp
#include "forecast/app.h"
#include "common/config.h"
#include "common/log.h"

AppConfig load_config_from_env()
{
  AppConfig c;
  c.model_path = env_str("TF_MODEL_PATH", c.model_path);
  c.training_source = env_str("TF_TRAINING_SOURCE", c.training_source);
  c.synthetic_samples = env_u32("TF_SYNTHETIC_SAMPLES", static_cast<uint32_t>(c.synthetic_samples));

  c.ingest.locations = env_u32("LOCATIONS", c.ingest.locations);
  c.ingest.hours = env_u32("HOURS", c.ingest.hours);

  c.cache.ttl_sec = env_u32("TF_CACHE_TTL_SEC", c.cache.ttl_sec);
  c.horizon.max_horizon_hours = static_cast<int>(env_u32("TF_MAX_HORIZON", static_cast<uint32_t>(c.horizon.max_horizon_hours)));
  c.service.default_horizons = env_int_list("TF_HORIZONS", c.service.default_horizons);

  c.train.forest.trees = static_cast<int>(env_u32("TF_FOREST_TREES", static_cast<uint32_t>(c.train.forest.trees)));
  c.train.boost.rounds = static_cast<int>(env_u32("TF_BOOST_ROUNDS", static_cast<uint32_t>(c.train.boost.rounds)));
  c.train.min_samples = env_u32("TF_MIN_SAMPLES", static_cast<uint32_t>(c.train.min_samples));
  c.train.scaler.prefer_opencl = env_bool("TF_PREFER_OPENCL", c.train.scaler.prefer_opencl);

  c.alert.level_threshold = static_cast<int>(env_u32("TF_ALERT_LEVEL", static_cast<uint32_t>(c.alert.level_threshold)));
  c.alert.cooldown_sec = env_u32("TF_ALERT_COOLDOWN_SEC", c.alert.cooldown_sec);
  return c;
}

void log_config(const AppConfig &c)
{
  LOG_INFO("config: model=%s source=%s samples=%zu locations=%u hours=%u",
           c.model_path.c_str(), c.training_source.c_str(), c.synthetic_samples,
           c.ingest.locations, c.ingest.hours);
  LOG_INFO("config: ttl=%us max_horizon=%dh trees=%d rounds=%d opencl=%s alert_level=%d",
           c.cache.ttl_sec, c.horizon.max_horizon_hours, c.train.forest.trees,
           c.train.boost.rounds, c.train.scaler.prefer_opencl ? "on" : "off", c.alert.level_threshold);
}

ForecastApp::ForecastApp(const AppConfig &cfg)
    : cfg_(cfg),
      ingestor_(cfg.ingest),
      pred_(cfg.pred),
      cache_(cfg.cache),
      service_(store_, pred_, fb_, cache_, &sink_, cfg.service, cfg.horizon),
      trainer_(cfg.train),
      alerts_(cfg.alert)
{
  source_ = make_training_source(cfg_.training_source, cfg_.synthetic_samples, cfg_.train.seed, &store_, fb_);
}

void ForecastApp::seed_observations(EpochSeconds end_ts)
{
  ingestor_.fill(store_, end_ts);
  LOG_INFO("seeded %zu observations for %u locations", store_.size(), cfg_.ingest.locations);
}

ModelSnapshot ForecastApp::bootstrap()
{
  return trainer_.load_or_bootstrap(pred_, *source_, cfg_.model_path);
}

ModelSnapshot ForecastApp::retrain()
{
  ModelSnapshot m = trainer_.retrain_and_swap(pred_, *source_, cfg_.model_path);
  // Cached sets name the previous model.
  for (const auto &loc : store_.locations())
    cache_.invalidate_location(loc);
  return m;
}
