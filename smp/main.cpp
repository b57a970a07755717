// smp/main.cpp

#include <thread>
#include <atomic>
#include <vector>
#include <cstdio>
#include <chrono>
#include "common/config.h"
#include "common/log.h"
#include "common/timers.h"
#include "forecast/app.h"

int main()
{
  AppConfig cfg = load_config_from_env();
  const uint32_t n_threads = env_u32("THREADS", 8);
  const uint32_t rounds = env_u32("ROUNDS", 12);
  log_config(cfg);

  ForecastApp app(cfg);
  const EpochSeconds now = hour_bucket(system_now());
  app.seed_observations(now);
  try
  {
    app.bootstrap();
  }
  catch (const std::exception &e)
  {
    LOG_ERROR("no model available: %s", e.what());
    return 1;
  }

  const std::vector<std::string> locs = app.store().locations();
  if (locs.empty())
  {
    LOG_ERROR("no locations to forecast");
    return 1;
  }

  std::atomic<uint64_t> served{0}, failed{0};
  std::atomic<uint32_t> swaps{0};

  // Every worker walks the same (location, hour) sequence so requests for
  // one key arrive together.
  std::vector<std::thread> workers;
  for (uint32_t t = 0; t < n_threads; ++t)
  {
    workers.emplace_back([&, t]
                         {
      for (uint32_t r = 0; r < rounds; ++r) {
        ForecastRequest req;
        req.location_id = locs[r % locs.size()];
        req.as_of = now + static_cast<EpochSeconds>(r) * kSecPerHour;
        try {
          ForecastResponse resp = app.service().forecast(req);
          served.fetch_add(1);
          if (t == 0)
            std::printf("round %2u | %s | %s | model %s | pts=%zu\n", r, req.location_id.c_str(),
                        resp.cache_hit ? "hit " : "miss", resp.model_id.c_str(), resp.set.points.size());
        } catch (const ForecastError &e) {
          failed.fetch_add(1);
          LOG_WARN("worker %u: %s", t, e.what());
        } catch (const std::exception &e) {
          failed.fetch_add(1);
          LOG_ERROR("worker %u: %s", t, e.what());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      } });
  }

  // Background retrain; readers keep their snapshot across the swap.
  std::thread trainer([&]
                      {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    try {
      auto m = app.retrain();
      swaps.fetch_add(1);
      LOG_INFO("swapped in %s", m->model_id.c_str());
    } catch (const std::exception &e) {
      LOG_ERROR("background retrain failed: %s", e.what());
    } });

  for (auto &w : workers)
    w.join();
  trainer.join();

  const CacheStats cs = app.cache().stats();
  std::printf("threads=%u rounds=%u | served=%llu failed=%llu | hits=%llu shared=%llu computations=%llu | swaps=%u sink=%zu\n",
              n_threads, rounds, (unsigned long long)served.load(), (unsigned long long)failed.load(),
              (unsigned long long)cs.hits, (unsigned long long)cs.shared,
              (unsigned long long)cs.computations, swaps.load(), app.sink().count());
  return failed.load() == 0 ? 0 : 2;
}
