#include "cache/cache.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <latch>
#include <stdexcept>
#include <thread>
#include <vector>
#include "test_util.h"

namespace
{
  ForecastSet sample_set(const std::string &loc, EpochSeconds as_of, double congestion = 55.0)
  {
    ForecastSet s;
    s.location_id = loc;
    s.as_of = as_of;
    s.bucket = hour_bucket(as_of);
    s.model_id = "m";
    ForecastPoint p;
    p.horizon_hours = 1;
    p.target_time = as_of + kSecPerHour;
    p.congestion = congestion;
    p.level = level_from_percent(congestion);
    s.points.push_back(p);
    return s;
  }

  // Backend that is always down.
  class DownBackend : public CacheBackend
  {
  public:
    std::optional<ForecastSet> get(const std::string &) override { throw CacheUnavailable("connection refused"); }
    void set(const std::string &, const ForecastSet &, uint32_t) override { throw CacheUnavailable("connection refused"); }
    void erase(const std::string &) override { throw CacheUnavailable("connection refused"); }
    size_t erase_prefix(const std::string &) override { throw CacheUnavailable("connection refused"); }
  };

  // Reads work, writes fail with an error that is not CacheUnavailable.
  class RejectingWriteBackend : public MemoryCacheBackend
  {
  public:
    void set(const std::string &, const ForecastSet &, uint32_t) override
    {
      throw std::runtime_error("write quota exceeded");
    }
  };

  // Lookups of "slow" keys block until release() is called.
  class GatedBackend : public MemoryCacheBackend
  {
  public:
    std::optional<ForecastSet> get(const std::string &key) override
    {
      if (key.find(":slow:") != std::string::npos)
      {
        if (!entered_once_.exchange(true))
          entered_.count_down();
        gate_.wait();
      }
      return MemoryCacheBackend::get(key);
    }

    void wait_entered() { entered_.wait(); }
    void release() { open_.set_value(); }

  private:
    std::atomic<bool> entered_once_{false};
    std::latch entered_{1};
    std::promise<void> open_;
    std::shared_future<void> gate_{open_.get_future().share()};
  };
} // namespace

TEST(ForecastCacheTest, KeyFormat)
{
  EXPECT_EQ(ForecastCache::key("loc-0007", kMonday2024 + 8 * kSecPerHour), "forecast:loc-0007:2024010108");
  EXPECT_EQ(ForecastCache::key("loc-0007", kMonday2024 + 8 * kSecPerHour + 1799),
            "forecast:loc-0007:2024010108");
}

TEST(ForecastCacheTest, HitWithinTtlMissAfter)
{
  FakeClock clock;
  ForecastCache cache(CacheConfig{}, clock.fn());
  int calls = 0;
  auto fn = [&] { ++calls; return sample_set("a", clock.now); };

  CacheOutcome oc;
  (void)cache.get_or_compute("a", clock.now, fn, &oc);
  EXPECT_TRUE(oc.computed);
  EXPECT_EQ(calls, 1);

  clock.advance(29 * 60);
  (void)cache.get_or_compute("a", kMonday2024, fn, &oc);
  EXPECT_TRUE(oc.hit);
  EXPECT_EQ(calls, 1);

  clock.advance(2 * 60);
  (void)cache.get_or_compute("a", kMonday2024, fn, &oc);
  EXPECT_TRUE(oc.computed);
  EXPECT_EQ(calls, 2);
}

TEST(ForecastCacheTest, SameHourSharesAnEntry)
{
  FakeClock clock;
  ForecastCache cache(CacheConfig{}, clock.fn());
  int calls = 0;
  auto fn = [&] { ++calls; return sample_set("a", kMonday2024); };

  (void)cache.get_or_compute("a", kMonday2024 + 10 * 60, fn);
  (void)cache.get_or_compute("a", kMonday2024 + 50 * 60, fn);
  EXPECT_EQ(calls, 1);
  (void)cache.get_or_compute("a", kMonday2024 + 61 * 60, fn);
  (void)cache.get_or_compute("b", kMonday2024 + 10 * 60, fn);
  EXPECT_EQ(calls, 3);
}

TEST(ForecastCacheTest, ConcurrentMissesComputeOnce)
{
  ForecastCache cache;
  constexpr int kThreads = 8;
  std::atomic<int> calls{0};
  std::latch start(kThreads);
  std::vector<ForecastSet> results(kThreads);

  auto fn = [&]
  {
    calls.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return sample_set("hot", kMonday2024, 77.0);
  };

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back([&, t]
    {
      start.arrive_and_wait();
      results[t] = cache.get_or_compute("hot", kMonday2024, fn);
    });
  }
  for (auto &th : threads)
    th.join();

  EXPECT_EQ(calls.load(), 1);
  for (const auto &r : results)
    EXPECT_EQ(r, results[0]);
  const CacheStats s = cache.stats();
  EXPECT_EQ(s.computations, 1u);
  EXPECT_EQ(s.hits + s.shared, static_cast<uint64_t>(kThreads - 1));
}

TEST(ForecastCacheTest, FailureReachesEveryWaiterAndIsNotStored)
{
  ForecastCache cache;
  constexpr int kThreads = 6;
  std::atomic<int> calls{0};
  std::atomic<int> failures{0};
  std::latch start(kThreads);

  auto failing = [&]() -> ForecastSet
  {
    calls.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    throw ModelNotLoadedError();
  };

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back([&]
    {
      start.arrive_and_wait();
      try
      {
        (void)cache.get_or_compute("x", kMonday2024, failing);
      }
      catch (const ModelNotLoadedError &)
      {
        failures.fetch_add(1);
      }
    });
  }
  for (auto &th : threads)
    th.join();

  EXPECT_EQ(failures.load(), kThreads);
  EXPECT_GE(calls.load(), 1);

  // Nothing was stored, so the next caller computes.
  int ok_calls = 0;
  const ForecastSet s = cache.get_or_compute("x", kMonday2024, [&] { ++ok_calls; return sample_set("x", kMonday2024); });
  EXPECT_EQ(ok_calls, 1);
  EXPECT_FALSE(s.empty());
}

TEST(ForecastCacheTest, EmptySetsAreNotStored)
{
  ForecastCache cache;
  int calls = 0;
  auto fn = [&] { ++calls; return ForecastSet{}; };
  (void)cache.get_or_compute("e", kMonday2024, fn);
  (void)cache.get_or_compute("e", kMonday2024, fn);
  EXPECT_EQ(calls, 2);
}

TEST(ForecastCacheTest, PartialSetsAreStored)
{
  ForecastCache cache;
  int calls = 0;
  auto fn = [&]
  {
    ++calls;
    ForecastSet s = sample_set("p", kMonday2024);
    s.failures.push_back({6, HorizonFailureKind::FeatureShape, "bad"});
    return s;
  };
  (void)cache.get_or_compute("p", kMonday2024, fn);
  const ForecastSet s = cache.get_or_compute("p", kMonday2024, fn);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(s.partial());
}

TEST(ForecastCacheTest, BackendOutageDegradesToDirectCompute)
{
  ForecastCache cache(std::make_shared<DownBackend>(), CacheConfig{});
  int calls = 0;
  auto fn = [&] { ++calls; return sample_set("d", kMonday2024); };

  CacheOutcome oc;
  const ForecastSet s = cache.get_or_compute("d", kMonday2024, fn, &oc);
  EXPECT_FALSE(s.empty());
  EXPECT_TRUE(oc.degraded);
  EXPECT_TRUE(oc.computed);
  (void)cache.get_or_compute("d", kMonday2024, fn, &oc);
  EXPECT_EQ(calls, 2);
  EXPECT_GE(cache.stats().degraded, 2u);

  EXPECT_NO_THROW(cache.invalidate("d", kMonday2024));
  EXPECT_EQ(cache.invalidate_location("d"), 0u);
}

TEST(ForecastCacheTest, InvalidateLocationClearsOnlyThatLocation)
{
  FakeClock clock;
  auto backend = std::make_shared<MemoryCacheBackend>(clock.fn());
  ForecastCache cache(backend, CacheConfig{});
  auto fn_for = [](const std::string &loc, EpochSeconds t) { return [=] { return sample_set(loc, t); }; };

  (void)cache.get_or_compute("a", kMonday2024, fn_for("a", kMonday2024));
  (void)cache.get_or_compute("a", kMonday2024 + kSecPerHour, fn_for("a", kMonday2024 + kSecPerHour));
  (void)cache.get_or_compute("ab", kMonday2024, fn_for("ab", kMonday2024));
  ASSERT_EQ(backend->size(), 3u);

  EXPECT_EQ(cache.invalidate_location("a"), 2u);
  EXPECT_EQ(backend->size(), 1u);

  cache.invalidate("ab", kMonday2024 + 15 * 60);
  EXPECT_EQ(backend->size(), 0u);
}

TEST(ForecastCacheTest, PurgeDropsExpiredEntries)
{
  FakeClock clock;
  auto backend = std::make_shared<MemoryCacheBackend>(clock.fn());
  ForecastCache cache(backend, CacheConfig{.ttl_sec = 60});
  (void)cache.get_or_compute("a", kMonday2024, [] { return sample_set("a", kMonday2024); });
  clock.advance(30);
  (void)cache.get_or_compute("b", kMonday2024, [] { return sample_set("b", kMonday2024); });
  clock.advance(40);
  EXPECT_EQ(cache.purge_expired(), 1u);
  EXPECT_EQ(backend->size(), 1u);
}

TEST(ForecastCacheTest, BackendWriteErrorStillReachesEveryCaller)
{
  ForecastCache cache(std::make_shared<RejectingWriteBackend>(), CacheConfig{});
  constexpr int kThreads = 4;
  std::atomic<int> calls{0};
  std::latch start(kThreads);
  std::vector<ForecastSet> results(kThreads);

  auto fn = [&]
  {
    calls.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return sample_set("w", kMonday2024);
  };

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back([&, t]
    {
      start.arrive_and_wait();
      results[t] = cache.get_or_compute("w", kMonday2024, fn);
    });
  }
  for (auto &th : threads)
    th.join();

  for (const auto &r : results)
    EXPECT_EQ(r, sample_set("w", kMonday2024));
  EXPECT_GE(cache.stats().degraded, 1u);

  // The key is free again: the next caller computes instead of waiting forever.
  const int before = calls.load();
  CacheOutcome oc;
  auto next = std::async(std::launch::async, [&] { return cache.get_or_compute("w", kMonday2024, fn, &oc); });
  ASSERT_EQ(next.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_FALSE(next.get().empty());
  EXPECT_TRUE(oc.computed);
  EXPECT_TRUE(oc.degraded);
  EXPECT_EQ(calls.load(), before + 1);
}

TEST(ForecastCacheTest, BudgetFailuresAreNotStored)
{
  ForecastCache cache;
  int calls = 0;
  auto fn = [&]
  {
    ++calls;
    ForecastSet s = sample_set("b", kMonday2024);
    s.failures.push_back({6, HorizonFailureKind::BudgetExceeded, "scoring took 20ms, budget 5ms"});
    return s;
  };
  (void)cache.get_or_compute("b", kMonday2024, fn);
  CacheOutcome oc;
  (void)cache.get_or_compute("b", kMonday2024, fn, &oc);
  EXPECT_EQ(calls, 2);
  EXPECT_TRUE(oc.computed);
}

TEST(ForecastCacheTest, SlowLookupDoesNotBlockOtherKeys)
{
  auto backend = std::make_shared<GatedBackend>();
  ForecastCache cache(backend, CacheConfig{});

  auto slow = std::async(std::launch::async, [&]
  {
    return cache.get_or_compute("slow", kMonday2024, [] { return sample_set("slow", kMonday2024); });
  });
  backend->wait_entered();

  auto fast = std::async(std::launch::async, [&]
  {
    return cache.get_or_compute("fast", kMonday2024, [] { return sample_set("fast", kMonday2024); });
  });
  const std::future_status st = fast.wait_for(std::chrono::seconds(5));
  backend->release();
  ASSERT_EQ(st, std::future_status::ready);
  EXPECT_EQ(fast.get().location_id, "fast");
  EXPECT_EQ(slow.get().location_id, "slow");
}
