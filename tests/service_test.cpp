#include "forecast/service.h"
#include <gtest/gtest.h>
#include "common/schema_json.h"
#include <chrono>
#include <latch>
#include <stdexcept>
#include <thread>
#include <vector>
#include "test_util.h"

namespace
{
  constexpr EpochSeconds kEight = kMonday2024 + 8 * kSecPerHour;

  class ForecastServiceTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      clock_.now = kEight + 5 * 60;
      store_.record(observation_at("loc-a", kEight - kSecPerHour, 2, 45.0));
      store_.record(observation_at("loc-a", kEight, 3, 38.0));
      store_.record(observation_at("loc-b", kEight, 1, 58.0));
      pred_.load(stub_model(constant(60.0), constant(70.0)));
    }

    ForecastService make_service()
    {
      return ForecastService(store_, pred_, fb_, cache_, &sink_, ServiceConfig{}, HorizonConfig{}, clock_.fn());
    }

    static ForecastRequest request(const std::string &loc, std::vector<int> horizons = {})
    {
      ForecastRequest r;
      r.location_id = loc;
      r.horizons = std::move(horizons);
      return r;
    }

    FakeClock clock_;
    MemoryObservationStore store_;
    FeatureBuilder fb_;
    EnsemblePredictor pred_;
    ForecastCache cache_{CacheConfig{}, clock_.fn()};
    MemoryForecastSink sink_;
  };

  std::vector<int> horizons_of(const ForecastSet &s)
  {
    std::vector<int> hs;
    for (const auto &p : s.points)
      hs.push_back(p.horizon_hours);
    return hs;
  }
} // namespace

TEST_F(ForecastServiceTest, DefaultHorizonsAndModelFields)
{
  ForecastService svc = make_service();
  const ForecastResponse r = svc.forecast(request("loc-a"));
  EXPECT_EQ(horizons_of(r.set), (std::vector<int>{1, 3, 6, 12, 24}));
  EXPECT_FALSE(r.set.partial());
  EXPECT_FALSE(r.cache_hit);
  EXPECT_EQ(r.model_id, "stub-model");
  EXPECT_EQ(r.set.bucket, kEight);
  for (const auto &p : r.set.points)
  {
    EXPECT_DOUBLE_EQ(p.congestion, 65.0);
    EXPECT_EQ(p.level, 4);
    EXPECT_EQ(p.target_time, r.set.as_of + p.horizon_hours * kSecPerHour);
  }
  EXPECT_TRUE(r.feature_importance.empty());
}

TEST_F(ForecastServiceTest, SecondCallInSameHourIsServedFromCache)
{
  ForecastService svc = make_service();
  const ForecastResponse first = svc.forecast(request("loc-a"));
  clock_.advance(20 * 60);
  const ForecastResponse second = svc.forecast(request("loc-a"));

  EXPECT_FALSE(first.cache_hit);
  EXPECT_TRUE(second.cache_hit);
  EXPECT_EQ(second.set, first.set);
  EXPECT_EQ(sink_.count(), 1u);
}

TEST_F(ForecastServiceTest, CachedSetTakesEachCallersFreeFlowSpeed)
{
  pred_.load(stub_model(constant(50.0), constant(50.0)));
  ForecastService svc = make_service();

  ForecastRequest slow = request("loc-a", {1});
  slow.free_flow_speed = 60.0;
  const ForecastResponse a = svc.forecast(slow);
  ASSERT_EQ(a.set.points.size(), 1u);
  EXPECT_NEAR(a.set.points[0].current_speed, 42.0, 1e-9);

  ForecastRequest fast = request("loc-a", {1});
  fast.free_flow_speed = 100.0;
  const ForecastResponse b = svc.forecast(fast);
  ASSERT_TRUE(b.cache_hit);
  ASSERT_EQ(b.set.points.size(), 1u);
  EXPECT_NEAR(b.set.points[0].current_speed, 70.0, 1e-9);
  EXPECT_NEAR(b.set.points[0].speed_reduction_percent, 30.0, 1e-9);
  EXPECT_DOUBLE_EQ(b.set.points[0].congestion, a.set.points[0].congestion);
}

TEST_F(ForecastServiceTest, BudgetFailuresAreNotServedToLaterCallers)
{
  // Target hour 14 is the 6h horizon from 08:00.
  auto slow_at_two = [](const double *x, size_t)
  {
    if (x[F_HOUR] == 14.0)
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return 50.0;
  };
  pred_.load(stub_model(slow_at_two, constant(50.0)));
  ForecastService svc = make_service();

  ForecastRequest hurried = request("loc-a");
  hurried.per_horizon_budget_ms = 5;
  const ForecastResponse a = svc.forecast(hurried);
  EXPECT_EQ(a.set.points.size(), 4u);
  ASSERT_EQ(a.set.failures.size(), 1u);
  EXPECT_EQ(a.set.failures[0].kind, HorizonFailureKind::BudgetExceeded);

  clock_.advance(10 * 60);
  const ForecastResponse b = svc.forecast(request("loc-a"));
  EXPECT_FALSE(b.cache_hit);
  EXPECT_EQ(b.set.points.size(), 5u);
  EXPECT_FALSE(b.set.partial());

  EXPECT_TRUE(svc.forecast(request("loc-a")).cache_hit);
}

TEST_F(ForecastServiceTest, ObservationOverrideBypassesCache)
{
  ForecastService svc = make_service();
  ForecastRequest what_if = request("loc-a", {1});
  what_if.observation = observation_at("loc-a", kEight, 5, 10.0);
  EXPECT_FALSE(svc.forecast(what_if).cache_hit);
  EXPECT_FALSE(svc.forecast(what_if).cache_hit);
  EXPECT_EQ(sink_.count(), 2u);

  // The override left no entry behind for callers using the live feed.
  EXPECT_FALSE(svc.forecast(request("loc-a")).cache_hit);
  EXPECT_TRUE(svc.forecast(request("loc-a")).cache_hit);
}

TEST_F(ForecastServiceTest, SwappedModelIsNotServedStaleEntries)
{
  ForecastService svc = make_service();
  EXPECT_EQ(svc.forecast(request("loc-a")).model_id, "stub-model");

  // Swap without clearing the cache, as a retrain racing a computation would.
  pred_.load(stub_model(constant(20.0), constant(30.0), "stub-next"));
  const ForecastResponse r = svc.forecast(request("loc-a"));
  EXPECT_FALSE(r.cache_hit);
  EXPECT_EQ(r.model_id, "stub-next");
  ASSERT_FALSE(r.set.points.empty());
  EXPECT_DOUBLE_EQ(r.set.points[0].congestion, 25.0);

  EXPECT_TRUE(svc.forecast(request("loc-a")).cache_hit);
  EXPECT_EQ(sink_.count(), 2u);
}

TEST_F(ForecastServiceTest, ResponseHoldsOnlyRequestedHorizons)
{
  ForecastService svc = make_service();
  const ForecastResponse r = svc.forecast(request("loc-a", {2}));
  EXPECT_EQ(horizons_of(r.set), (std::vector<int>{2}));

  // The stored set also carries the defaults.
  ASSERT_EQ(sink_.count(), 1u);
  EXPECT_EQ(horizons_of(sink_.stored()[0]), (std::vector<int>{1, 2, 3, 6, 12, 24}));

  // A later default request is answered from that entry.
  EXPECT_TRUE(svc.forecast(request("loc-a")).cache_hit);
  EXPECT_EQ(sink_.count(), 1u);
}

TEST_F(ForecastServiceTest, UncoveredHorizonRecomputes)
{
  ForecastService svc = make_service();
  (void)svc.forecast(request("loc-a"));
  const ForecastResponse r = svc.forecast(request("loc-a", {48, 3}));
  EXPECT_FALSE(r.cache_hit);
  EXPECT_EQ(horizons_of(r.set), (std::vector<int>{3, 48}));
  EXPECT_EQ(sink_.count(), 2u);

  EXPECT_TRUE(svc.forecast(request("loc-a", {48})).cache_hit);
}

TEST_F(ForecastServiceTest, MissingObservationRaisesAndIsNotCached)
{
  ForecastService svc = make_service();
  EXPECT_THROW((void)svc.forecast(request("loc-z")), ObservationUnavailable);
  EXPECT_EQ(sink_.count(), 0u);

  store_.record(observation_at("loc-z", kEight, 5, 12.0));
  const ForecastResponse r = svc.forecast(request("loc-z"));
  EXPECT_FALSE(r.cache_hit);
  EXPECT_EQ(r.set.points.size(), 5u);
}

TEST_F(ForecastServiceTest, ExplicitObservationNeedsNoStore)
{
  ForecastService svc = make_service();
  ForecastRequest req = request("loc-z", {1});
  req.observation = observation_at("loc-z", kEight, 4, 20.0);
  EXPECT_EQ(svc.forecast(req).set.points.size(), 1u);
}

TEST_F(ForecastServiceTest, UnloadedModelRaises)
{
  pred_.unload();
  ForecastService svc = make_service();
  EXPECT_THROW((void)svc.forecast(request("loc-a")), ModelNotLoadedError);
  EXPECT_EQ(sink_.count(), 0u);
}

TEST_F(ForecastServiceTest, InvalidRequestsAreRejected)
{
  ForecastService svc = make_service();
  EXPECT_THROW((void)svc.forecast(request("")), InvalidRequestError);
  EXPECT_THROW((void)svc.forecast(request("loc-a", {0})), InvalidRequestError);
  EXPECT_THROW((void)svc.forecast(request("loc-a", {169})), InvalidRequestError);
  ForecastRequest neg = request("loc-a");
  neg.free_flow_speed = -5.0;
  EXPECT_THROW((void)svc.forecast(neg), InvalidRequestError);
}

TEST_F(ForecastServiceTest, FeatureImportanceOnRequest)
{
  ForecastService svc = make_service();
  ForecastRequest req = request("loc-a");
  req.include_feature_importance = true;
  const ForecastResponse r = svc.forecast(req);
  ASSERT_EQ(r.feature_importance.size(), kNumFeatures);
  EXPECT_DOUBLE_EQ(r.feature_importance.at("hour_of_day"), 1.0);
}

TEST_F(ForecastServiceTest, OneBadHorizonGivesPartialSet)
{
  // Target hour 14 is the 6h horizon from 08:00.
  auto picky = [](const double *x, size_t)
  {
    if (x[F_HOUR] == 14.0)
      throw std::runtime_error("bad leaf");
    return 40.0;
  };
  pred_.load(stub_model(picky, constant(40.0)));
  ForecastService svc = make_service();

  const ForecastResponse r = svc.forecast(request("loc-a"));
  EXPECT_TRUE(r.set.partial());
  EXPECT_EQ(horizons_of(r.set), (std::vector<int>{1, 3, 12, 24}));
  ASSERT_EQ(r.set.failures.size(), 1u);
  EXPECT_EQ(r.set.failures[0].horizon_hours, 6);
  EXPECT_EQ(r.set.failures[0].kind, HorizonFailureKind::ScoringError);
  EXPECT_THROW(r.set.require_complete(), PartialHorizonFailure);

  // Partial sets are still persisted and cached.
  EXPECT_EQ(sink_.count(), 1u);
  EXPECT_TRUE(svc.forecast(request("loc-a", {6})).cache_hit);
}

TEST_F(ForecastServiceTest, ConcurrentRequestsComputeOnce)
{
  ForecastService svc = make_service();
  constexpr int kThreads = 8;
  std::latch start(kThreads);
  std::vector<ForecastSet> sets(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back([&, t]
    {
      start.arrive_and_wait();
      sets[t] = svc.forecast(request("loc-a")).set;
    });
  }
  for (auto &th : threads)
    th.join();

  EXPECT_EQ(sink_.count(), 1u);
  EXPECT_EQ(cache_.stats().computations, 1u);
  for (const auto &s : sets)
    EXPECT_EQ(s, sets[0]);
}

TEST_F(ForecastServiceTest, RefreshAllReportsEveryLocation)
{
  ForecastService svc = make_service();
  const auto out = svc.refresh_all();
  ASSERT_EQ(out.size(), 2u);
  for (const auto &r : out)
  {
    EXPECT_TRUE(r.ok) << r.location_id;
    EXPECT_EQ(r.points, 5u);
    EXPECT_TRUE(r.error.empty());
  }
  EXPECT_EQ(sink_.count(), 2u);
}

TEST_F(ForecastServiceTest, RefreshAllSurvivesUnloadedModel)
{
  pred_.unload();
  ForecastService svc = make_service();
  std::vector<RefreshOutcome> out;
  EXPECT_NO_THROW(out = svc.refresh_all({1, 2}));
  ASSERT_EQ(out.size(), 2u);
  for (const auto &r : out)
  {
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.error.empty());
  }
}

TEST(SelectHorizonsTest, KeepsPointsAndFailuresInRequest)
{
  ForecastSet s;
  for (int h : {1, 3, 6})
  {
    ForecastPoint p;
    p.horizon_hours = h;
    s.points.push_back(p);
  }
  s.failures.push_back({12, HorizonFailureKind::BudgetExceeded, "late"});
  const ForecastSet a = select_horizons(s, {3, 12});
  EXPECT_EQ(horizons_of(a), (std::vector<int>{3}));
  EXPECT_EQ(a.failures.size(), 1u);
  const ForecastSet b = select_horizons(s, {1});
  EXPECT_FALSE(b.partial());
}

TEST_F(ForecastServiceTest, SetRendersAsJson)
{
  ForecastService svc = make_service();
  const ForecastSet s = svc.forecast(request("loc-a", {1, 3})).set;
  const json j = s;
  EXPECT_EQ(j["location_id"], "loc-a");
  EXPECT_EQ(j["partial"], false);
  ASSERT_EQ(j["predictions"].size(), 2u);
  EXPECT_EQ(j["predictions"][1]["forecast_hours"], 3);
  EXPECT_EQ(j["predictions"][0]["congestion_level"], 4);
  EXPECT_EQ(j.get<ForecastSet>(), s);
}
