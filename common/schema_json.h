// common/schema_json.h
#pragma once
#include <nlohmann/json.hpp>
#include "common/schema.h"

using json = nlohmann::json;

inline void to_json(json &j, const ForecastPoint &p)
{
  j = json{{"forecast_hours", p.horizon_hours},
           {"target_time", p.target_time},
           {"target_time_iso", format_iso8601(p.target_time)},
           {"predicted_congestion", p.congestion},
           {"congestion_level", p.level},
           {"confidence", p.confidence},
           {"horizon_confidence", p.horizon_confidence},
           {"current_speed", p.current_speed},
           {"speed_reduction_percent", p.speed_reduction_percent},
           {"model", p.model}};
}

inline void from_json(const json &j, ForecastPoint &p)
{
  p.horizon_hours = j.at("forecast_hours").get<int>();
  p.target_time = j.at("target_time").get<EpochSeconds>();
  p.congestion = j.at("predicted_congestion").get<double>();
  p.level = j.at("congestion_level").get<int>();
  p.confidence = j.at("confidence").get<double>();
  p.horizon_confidence = j.value("horizon_confidence", 0.0);
  p.current_speed = j.value("current_speed", 0.0);
  p.speed_reduction_percent = j.value("speed_reduction_percent", 0.0);
  p.model = j.value("model", std::string{});
}

inline void to_json(json &j, const HorizonFailure &f)
{
  j = json{{"forecast_hours", f.horizon_hours},
           {"kind", horizon_failure_name(f.kind)},
           {"message", f.message}};
}

inline void from_json(const json &j, HorizonFailure &f)
{
  f.horizon_hours = j.at("forecast_hours").get<int>();
  const auto kind = j.at("kind").get<std::string>();
  if (kind == "feature_shape")
    f.kind = HorizonFailureKind::FeatureShape;
  else if (kind == "budget_exceeded")
    f.kind = HorizonFailureKind::BudgetExceeded;
  else
    f.kind = HorizonFailureKind::ScoringError;
  f.message = j.value("message", std::string{});
}

inline void to_json(json &j, const ForecastSet &s)
{
  j = json{{"location_id", s.location_id},
           {"as_of", s.as_of},
           {"bucket", s.bucket},
           {"model_id", s.model_id},
           {"model_version", s.model_version},
           {"partial", s.partial()},
           {"predictions", s.points},
           {"failures", s.failures}};
}

inline void from_json(const json &j, ForecastSet &s)
{
  s.location_id = j.at("location_id").get<std::string>();
  s.as_of = j.at("as_of").get<EpochSeconds>();
  s.bucket = j.at("bucket").get<EpochSeconds>();
  s.model_id = j.value("model_id", std::string{});
  s.model_version = j.value("model_version", std::string{});
  s.points = j.at("predictions").get<std::vector<ForecastPoint>>();
  s.failures = j.value("failures", std::vector<HorizonFailure>{});
}
