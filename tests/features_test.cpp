#include "features/features.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "test_util.h"

TEST(FeatureSchemaTest, FifteenFieldsInFixedOrder)
{
  const std::vector<std::string> expected = {
    "hour_of_day", "day_of_week", "is_weekend", "is_holiday",
    "temperature", "precipitation", "visibility",
    "vehicle_count", "average_speed", "incident_reported", "event_nearby",
    "congestion_lag_1h", "congestion_lag_3h", "congestion_lag_24h", "speed_lag_1h"};
  EXPECT_EQ(kNumFeatures, 15u);
  EXPECT_EQ(feature_name_list(), expected);
}

TEST(FeatureBuilderTest, CalendarFieldsFollowAsOf)
{
  FeatureBuilder fb;
  Observation o;

  FeatureVector mon = fb.build(o, kMonday2024 + 8 * kSecPerHour, {});
  EXPECT_EQ(mon[F_HOUR], 8.0);
  EXPECT_EQ(mon[F_DOW], 0.0);
  EXPECT_EQ(mon[F_WEEKEND], 0.0);

  FeatureVector sat = fb.build(o, kMonday2024 + 5 * kSecPerDay + 23 * kSecPerHour, {});
  EXPECT_EQ(sat[F_HOUR], 23.0);
  EXPECT_EQ(sat[F_DOW], 5.0);
  EXPECT_EQ(sat[F_WEEKEND], 1.0);

  FeatureVector sun = fb.build(o, kMonday2024 + 6 * kSecPerDay, {});
  EXPECT_EQ(sun[F_DOW], 6.0);
  EXPECT_EQ(sun[F_WEEKEND], 1.0);
}

TEST(FeatureBuilderTest, MissingFieldsUseDefaults)
{
  FeatureBuilder fb;
  const FeatureVector fv = fb.build(Observation{}, kMonday2024, {});
  ASSERT_EQ(fv.size(), kNumFeatures);
  EXPECT_EQ(fv[F_HOLIDAY], 0.0);
  EXPECT_EQ(fv[F_TEMPERATURE], 20.0);
  EXPECT_EQ(fv[F_PRECIPITATION], 0.0);
  EXPECT_EQ(fv[F_VISIBILITY], 10.0);
  EXPECT_EQ(fv[F_VEHICLE_COUNT], 100.0);
  EXPECT_EQ(fv[F_AVG_SPEED], 40.0);
  EXPECT_EQ(fv[F_INCIDENT], 0.0);
  EXPECT_EQ(fv[F_EVENT], 0.0);
  EXPECT_EQ(fv[F_LAG_1H], 2.0);
  EXPECT_EQ(fv[F_LAG_3H], 2.0);
  EXPECT_EQ(fv[F_LAG_24H], 2.0);
  EXPECT_EQ(fv[F_SPEED_LAG_1H], 40.0);
}

TEST(FeatureBuilderTest, ReportedFieldsPassThrough)
{
  FeatureBuilder fb;
  Observation o;
  o.temperature = 3.5;
  o.precipitation = 7.0;
  o.visibility = 1.5;
  o.vehicle_count = 240;
  o.average_speed = 22.0;
  o.incident_reported = true;
  o.event_nearby = true;
  o.is_holiday = true;
  const FeatureVector fv = fb.build(o, kMonday2024, {});
  EXPECT_EQ(fv[F_TEMPERATURE], 3.5);
  EXPECT_EQ(fv[F_PRECIPITATION], 7.0);
  EXPECT_EQ(fv[F_VISIBILITY], 1.5);
  EXPECT_EQ(fv[F_VEHICLE_COUNT], 240.0);
  EXPECT_EQ(fv[F_AVG_SPEED], 22.0);
  EXPECT_EQ(fv[F_INCIDENT], 1.0);
  EXPECT_EQ(fv[F_EVENT], 1.0);
  EXPECT_EQ(fv[F_HOLIDAY], 1.0);
}

TEST(FeatureBuilderTest, EmptyWindowFallsBackToCurrentObservation)
{
  FeatureBuilder fb;
  const Observation o = observation_at("a", kMonday2024, 4, 31.0);
  const FeatureVector fv = fb.build(o, kMonday2024, {});
  EXPECT_EQ(fv[F_LAG_1H], 4.0);
  EXPECT_EQ(fv[F_LAG_3H], 2.0);
  EXPECT_EQ(fv[F_LAG_24H], 2.0);
  EXPECT_EQ(fv[F_SPEED_LAG_1H], 31.0);
}

TEST(FeatureBuilderTest, ShortWindowDefaultsTheDayLag)
{
  FeatureBuilder fb;
  std::vector<Observation> window;
  for (int i = 0; i < 10; ++i)
    window.push_back(observation_at("a", kMonday2024 + i * kSecPerHour, 1 + i % 5, 50.0 + i));

  const FeatureVector fv = fb.build(window.back(), kMonday2024 + 10 * kSecPerHour, window);
  EXPECT_EQ(fv[F_LAG_1H], 1.0 + 9 % 5);  // last element
  EXPECT_EQ(fv[F_LAG_3H], 1.0 + 7 % 5);  // third from last
  EXPECT_EQ(fv[F_LAG_24H], 2.0);         // window shorter than 24
  EXPECT_EQ(fv[F_SPEED_LAG_1H], 59.0);
}

TEST(FeatureBuilderTest, FullWindowUsesTwentyFourthFromLast)
{
  FeatureBuilder fb;
  std::vector<Observation> window;
  for (int i = 0; i < 30; ++i)
    window.push_back(observation_at("a", kMonday2024 + i * kSecPerHour, 1 + i % 5, 40.0));

  const FeatureVector fv = fb.build(window.back(), kMonday2024 + 30 * kSecPerHour, window);
  EXPECT_EQ(fv[F_LAG_24H], 1.0 + 6 % 5);
}

TEST(FeatureBuilderTest, LagSlotWithoutLevelUsesDefault)
{
  FeatureBuilder fb;
  std::vector<Observation> window(3);
  window[0].congestion_level = 5;
  window[2].average_speed = 12.0;
  const FeatureVector fv = fb.build(Observation{}, kMonday2024, window);
  EXPECT_EQ(fv[F_LAG_1H], 2.0);
  EXPECT_EQ(fv[F_LAG_3H], 5.0);
  EXPECT_EQ(fv[F_SPEED_LAG_1H], 12.0);
}

TEST(FeatureBuilderTest, BuildIsDeterministic)
{
  FeatureBuilder fb;
  std::vector<Observation> window;
  for (int i = 0; i < 5; ++i)
    window.push_back(observation_at("a", kMonday2024 + i * kSecPerHour, 3, 45.0));
  const Observation o = observation_at("a", kMonday2024 + 5 * kSecPerHour, 4, 30.0);
  EXPECT_EQ(fb.build(o, kMonday2024 + 6 * kSecPerHour, window).f,
            fb.build(o, kMonday2024 + 6 * kSecPerHour, window).f);
}

TEST(FeatureBuilderTest, DescribeListsEveryField)
{
  FeatureBuilder fb;
  const std::string s = describe_features(fb.build(Observation{}, kMonday2024, {}));
  for (auto name : kFeatureNames)
    EXPECT_NE(s.find(std::string(name) + "="), std::string::npos) << name;
}

TEST(CongestionScaleTest, LevelBoundaries)
{
  EXPECT_EQ(level_from_percent(0.0), 1);
  EXPECT_EQ(level_from_percent(19.9), 1);
  EXPECT_EQ(level_from_percent(20.0), 2);
  EXPECT_EQ(level_from_percent(79.9), 4);
  EXPECT_EQ(level_from_percent(80.0), 5);
  EXPECT_EQ(level_from_percent(100.0), 5);
  EXPECT_EQ(percent_from_level(1), 10.0);
  EXPECT_EQ(percent_from_level(5), 90.0);
  for (int l = kLevelMin; l <= kLevelMax; ++l)
    EXPECT_EQ(level_from_percent(percent_from_level(l)), l);
}
