// cache/cache.h
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "common/schema.h"
#include "common/timers.h"

struct CacheConfig
{
  uint32_t ttl_sec = 1800; // measured from insertion
};

// Key/value storage under the forecast cache. Implementations signal an
// outage by throwing CacheUnavailable.
class CacheBackend
{
public:
  virtual ~CacheBackend() = default;

  virtual std::optional<ForecastSet> get(const std::string &key) = 0;
  virtual void set(const std::string &key, const ForecastSet &value, uint32_t ttl_sec) = 0;
  virtual void erase(const std::string &key) = 0;
  // Returns the number of keys removed.
  virtual size_t erase_prefix(const std::string &prefix) = 0;
  virtual size_t purge_expired() { return 0; }
};

class MemoryCacheBackend : public CacheBackend
{
public:
  explicit MemoryCacheBackend(WallClock clock = system_wall_clock());

  std::optional<ForecastSet> get(const std::string &key) override;
  void set(const std::string &key, const ForecastSet &value, uint32_t ttl_sec) override;
  void erase(const std::string &key) override;
  size_t erase_prefix(const std::string &prefix) override;
  size_t purge_expired() override;

  [[nodiscard]] size_t size() const;

private:
  struct Entry
  {
    ForecastSet value;
    EpochSeconds expires_at = 0;
  };

  WallClock clock_;
  mutable std::mutex mu_;
  std::map<std::string, Entry> entries_;
};

// What happened on one get_or_compute call.
struct CacheOutcome
{
  bool hit = false;      // served from storage
  bool computed = false; // this caller ran compute_fn
  bool shared = false;   // joined another caller's computation
  bool degraded = false; // backend unavailable, served uncached
};

struct CacheStats
{
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t computations = 0;
  uint64_t shared = 0;
  uint64_t failures = 0;
  uint64_t degraded = 0;
};

// Forecast sets keyed by (location, hour bucket) with single-flight
// computation: concurrent misses on one key run compute_fn once and all
// callers receive its result or its exception. Failures, empty sets and sets
// with budget failures are never stored.
class ForecastCache
{
public:
  using ComputeFn = std::function<ForecastSet()>;

  explicit ForecastCache(const CacheConfig &c = {}, WallClock clock = system_wall_clock());
  ForecastCache(std::shared_ptr<CacheBackend> backend, const CacheConfig &c);

  ForecastSet get_or_compute(const std::string &location_id,
                             EpochSeconds bucket,
                             const ComputeFn &compute_fn,
                             CacheOutcome *outcome = nullptr);

  void invalidate(const std::string &location_id, EpochSeconds bucket);
  size_t invalidate_location(const std::string &location_id);
  size_t purge_expired();

  [[nodiscard]] CacheStats stats() const;
  [[nodiscard]] const CacheConfig &config() const { return cfg_; }

  // forecast:<location>:<YYYYMMDDHH>
  static std::string key(const std::string &location_id, EpochSeconds bucket);

private:
  std::shared_ptr<CacheBackend> backend_;
  CacheConfig cfg_;

  std::mutex mu_;
  std::map<std::string, std::shared_future<ForecastSet>> inflight_;
  uint64_t published_ = 0; // computations finished, guarded by mu_

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> computations_{0};
  std::atomic<uint64_t> shared_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<uint64_t> degraded_{0};

  std::optional<ForecastSet> lookup(const std::string &key, bool &degraded);
  // Never throws; backend errors mark the outcome degraded.
  void store(const std::string &key, const ForecastSet &value, bool &degraded);
  // Unregisters the in-flight computation for key.
  void release(const std::string &key);
};
