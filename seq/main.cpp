// seq/main.cpp

#include <vector>
#include <cstdio>
#include <cstring>
#include "common/log.h"
#include "common/schema_json.h"
#include "common/timers.h"
#include "forecast/app.h"

int main(int argc, char **argv)
{
  const bool as_json = argc > 1 && std::strcmp(argv[1], "--json") == 0;

  AppConfig cfg = load_config_from_env();
  log_config(cfg);
  ForecastApp app(cfg);

  const EpochSeconds now = system_now();
  app.seed_observations(hour_bucket(now));

  try
  {
    app.bootstrap();
  }
  catch (const ForecastError &e)
  {
    LOG_ERROR("no model available: %s (%s)", e.what(), error_class_name(e.error_class()));
    return 1;
  }
  catch (const std::exception &e)
  {
    LOG_ERROR("no model available: %s", e.what());
    return 1;
  }

  const ModelInfo info = app.predictor().model_info();
  std::printf("model %s | rmse %.2f | mae %.2f | r2 %.3f\n", info.model_id.c_str(),
              info.metrics.rmse, info.metrics.mae, info.metrics.r2);

  std::vector<AlertDecision> alerts;
  // Second pass is served from the cache.
  for (int pass = 0; pass < 2; ++pass)
  {
    for (const auto &loc : app.store().locations())
    {
      ForecastRequest req;
      req.location_id = loc;
      req.as_of = now;
      req.include_feature_importance = as_json && pass == 0;

      auto t0 = now_ms();
      ForecastResponse resp;
      try
      {
        resp = app.service().forecast(req);
      }
      catch (const std::exception &e)
      {
        LOG_ERROR("forecast %s: %s", loc.c_str(), e.what());
        continue;
      }
      auto t1 = now_ms();
      app.alerts().decide(resp.set, alerts);

      if (as_json)
      {
        json j = resp.set;
        if (!resp.feature_importance.empty())
          j["feature_importance"] = resp.feature_importance;
        std::printf("%s\n", j.dump().c_str());
        continue;
      }

      std::printf("%s pass %d | %s | %zu pts | lat=%lldms\n", loc.c_str(), pass,
                  resp.cache_hit ? "hit " : "miss", resp.set.points.size(), (long long)(t1 - t0));
      if (pass > 0)
        continue;
      for (const auto &p : resp.set.points)
        std::printf("   +%3dh %s | %5.1f%% L%d | conf %.2f/%.2f | %5.1f km/h\n", p.horizon_hours,
                    format_iso8601(p.target_time).c_str(), p.congestion, p.level, p.confidence,
                    p.horizon_confidence, p.current_speed);
    }
  }

  const CacheStats cs = app.cache().stats();
  std::printf("cache hits=%llu misses=%llu computations=%llu | sink=%zu | alerts=%zu\n",
              (unsigned long long)cs.hits, (unsigned long long)cs.misses,
              (unsigned long long)cs.computations, app.sink().count(), alerts.size());
  return 0;
}
