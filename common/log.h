// common/log.h
#pragma once
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <chrono>

enum class LogLevel : int
{
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
  Off = 4
};

// Global log mutex for line integrity.
inline std::mutex &log_mutex()
{
  static std::mutex m;
  return m;
}

// Optional timestamp helper (steady ms)
inline uint64_t log_now_ms()
{
  using Clock = std::chrono::steady_clock;
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             Clock::now().time_since_epoch())
      .count();
}

// Threshold from TF_LOG_LEVEL (debug|info|warn|error|off), read once.
inline LogLevel log_threshold()
{
  static const LogLevel lvl = []
  {
    const char *e = std::getenv("TF_LOG_LEVEL");
    if (!e)
      return LogLevel::Info;
    if (std::strcmp(e, "debug") == 0)
      return LogLevel::Debug;
    if (std::strcmp(e, "warn") == 0)
      return LogLevel::Warn;
    if (std::strcmp(e, "error") == 0)
      return LogLevel::Error;
    if (std::strcmp(e, "off") == 0)
      return LogLevel::Off;
    return LogLevel::Info;
  }();
  return lvl;
}

inline bool log_timestamps()
{
  static const bool on = []
  {
    const char *e = std::getenv("TF_LOG_TIMESTAMPS");
    return e && e[0] == '1';
  }();
  return on;
}

inline const char *log_tag(LogLevel lvl)
{
  switch (lvl)
  {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO ";
  case LogLevel::Warn:
    return "WARN ";
  case LogLevel::Error:
    return "ERROR";
  default:
    return "";
  }
}

// Thread-safe single-line logger (printf-style).
template <typename... Args>
inline void LOG_AT(LogLevel lvl, const char *fmt, Args... args)
{
  if (static_cast<int>(lvl) < static_cast<int>(log_threshold()))
    return;
  std::lock_guard<std::mutex> g(log_mutex());
  if (log_timestamps())
    std::fprintf(stderr, "[%llu] ", static_cast<unsigned long long>(log_now_ms()));
  std::fprintf(stderr, "[%s] ", log_tag(lvl));
  if constexpr (sizeof...(Args) == 0)
    std::fputs(fmt, stderr);
  else
    std::fprintf(stderr, fmt, args...);
  std::fprintf(stderr, "\n");
  std::fflush(stderr);
}

template <typename... Args>
inline void LOG_DEBUG(const char *fmt, Args... args) { LOG_AT(LogLevel::Debug, fmt, args...); }

template <typename... Args>
inline void LOG_INFO(const char *fmt, Args... args) { LOG_AT(LogLevel::Info, fmt, args...); }

template <typename... Args>
inline void LOG_WARN(const char *fmt, Args... args) { LOG_AT(LogLevel::Warn, fmt, args...); }

template <typename... Args>
inline void LOG_ERROR(const char *fmt, Args... args) { LOG_AT(LogLevel::Error, fmt, args...); }
