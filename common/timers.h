// common/timers.h
#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>

using Clock = std::chrono::steady_clock;

// Wall-clock instants are UTC epoch seconds throughout.
using EpochSeconds = int64_t;
using WallClock = std::function<EpochSeconds()>;

inline constexpr EpochSeconds kSecPerHour = 3600;
inline constexpr EpochSeconds kSecPerDay = 86400;

[[nodiscard]] inline uint64_t now_ms()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             Clock::now().time_since_epoch())
      .count();
}

[[nodiscard]] inline EpochSeconds system_now()
{
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline WallClock system_wall_clock()
{
  return [] { return system_now(); };
}

// Truncate to the start of the hour.
[[nodiscard]] inline EpochSeconds hour_bucket(EpochSeconds t)
{
  EpochSeconds r = t % kSecPerHour;
  if (r < 0)
    r += kSecPerHour;
  return t - r;
}

[[nodiscard]] inline int hour_of_day(EpochSeconds t)
{
  const auto tp = std::chrono::sys_seconds{std::chrono::seconds{t}};
  const auto day = std::chrono::floor<std::chrono::days>(tp);
  return static_cast<int>(std::chrono::duration_cast<std::chrono::hours>(tp - day).count());
}

// Monday = 0 ... Sunday = 6
[[nodiscard]] inline int day_of_week(EpochSeconds t)
{
  const auto day = std::chrono::floor<std::chrono::days>(std::chrono::sys_seconds{std::chrono::seconds{t}});
  return static_cast<int>(std::chrono::weekday{day}.iso_encoding()) - 1;
}

// YYYYMMDDHH, used in cache keys.
inline std::string format_hour_key(EpochSeconds t)
{
  const auto tp = std::chrono::sys_seconds{std::chrono::seconds{t}};
  const auto day = std::chrono::floor<std::chrono::days>(tp);
  const std::chrono::year_month_day ymd{day};
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%02u%02u%02d",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), hour_of_day(t));
  return buf;
}

inline std::string format_iso8601(EpochSeconds t)
{
  const auto tp = std::chrono::sys_seconds{std::chrono::seconds{t}};
  const auto day = std::chrono::floor<std::chrono::days>(tp);
  const std::chrono::year_month_day ymd{day};
  const std::chrono::hh_mm_ss hms{tp - day};
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()));
  return buf;
}

// Convenience timer with a fixed budget. budget_ms == 0 means unbounded.
struct Deadline
{
  uint64_t start_ms{now_ms()};
  uint32_t budget_ms{0};

  [[nodiscard]] inline bool bounded() const { return budget_ms > 0; }
  [[nodiscard]] inline uint64_t end_ms() const { return start_ms + budget_ms; }
  [[nodiscard]] inline bool expired() const { return bounded() && now_ms() >= end_ms(); }
  [[nodiscard]] inline uint32_t elapsed() const { return static_cast<uint32_t>(now_ms() - start_ms); }
};
