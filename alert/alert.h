// alert/alert.h
#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "common/schema.h"
#include "common/timers.h"

struct AlertConfig
{
  int level_threshold = 3;          // congestion level 1..5 that triggers
  double min_confidence = 0.6;      // after derating, 0..1
  int max_horizon_hours = 24;       // later points never alert
  uint8_t heuristic_derate_pct = 50; // applied to confidence when the set is partial
  uint32_t cooldown_sec = 3600;     // per location
};

enum class AlertReason : uint8_t
{
  Model = 0,    // complete forecast set
  Heuristic = 1 // partial set, confidence derated
};

inline const char *alert_reason_name(AlertReason r)
{
  return r == AlertReason::Model ? "MODEL" : "HEUR";
}

struct AlertDecision
{
  std::string location_id;
  int horizon_hours = 0;
  EpochSeconds target_time = 0;
  double congestion = 0.0;
  int level = kLevelMin;
  double confidence = 0.0;
  AlertReason reason = AlertReason::Model;
};

class AlertEvaluator
{
public:
  explicit AlertEvaluator(const AlertConfig &c, WallClock clock = system_wall_clock());

  // Appends at most one decision: the earliest point over the threshold.
  // A location that alerted within the cooldown is suppressed.
  void decide(const ForecastSet &set, std::vector<AlertDecision> &out);
  // Replaces `out` with the decisions for the whole batch.
  void decide(const std::vector<ForecastSet> &sets, std::vector<AlertDecision> &out);

  void reset(const std::string &location_id);
  [[nodiscard]] uint64_t suppressed() const;

private:
  AlertConfig cfg_;
  WallClock clock_;

  mutable std::mutex mu_;
  std::map<std::string, EpochSeconds> last_alert_;
  uint64_t suppressed_ = 0;

  bool evaluate(const ForecastSet &set, AlertDecision &d) const;
};
