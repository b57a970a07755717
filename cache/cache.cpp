// cache/cache.cpp
#include "cache/cache.h"
#include <exception>
#include <utility>
#include "common/log.h"

namespace
{
  inline std::string location_prefix(const std::string &location_id)
  {
    return "forecast:" + location_id + ":";
  }
} // namespace

MemoryCacheBackend::MemoryCacheBackend(WallClock clock) : clock_(std::move(clock)) {}

std::optional<ForecastSet> MemoryCacheBackend::get(const std::string &key)
{
  std::lock_guard<std::mutex> g(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  if (clock_() >= it->second.expires_at)
  {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

void MemoryCacheBackend::set(const std::string &key, const ForecastSet &value, uint32_t ttl_sec)
{
  std::lock_guard<std::mutex> g(mu_);
  entries_[key] = Entry{value, clock_() + static_cast<EpochSeconds>(ttl_sec)};
}

void MemoryCacheBackend::erase(const std::string &key)
{
  std::lock_guard<std::mutex> g(mu_);
  entries_.erase(key);
}

size_t MemoryCacheBackend::erase_prefix(const std::string &prefix)
{
  std::lock_guard<std::mutex> g(mu_);
  size_t n = 0;
  auto it = entries_.lower_bound(prefix);
  while (it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0)
  {
    it = entries_.erase(it);
    ++n;
  }
  return n;
}

size_t MemoryCacheBackend::purge_expired()
{
  std::lock_guard<std::mutex> g(mu_);
  const EpochSeconds now = clock_();
  size_t n = 0;
  for (auto it = entries_.begin(); it != entries_.end();)
  {
    if (now >= it->second.expires_at)
    {
      it = entries_.erase(it);
      ++n;
    }
    else
      ++it;
  }
  return n;
}

size_t MemoryCacheBackend::size() const
{
  std::lock_guard<std::mutex> g(mu_);
  return entries_.size();
}

ForecastCache::ForecastCache(const CacheConfig &c, WallClock clock)
    : backend_(std::make_shared<MemoryCacheBackend>(std::move(clock))), cfg_(c) {}

ForecastCache::ForecastCache(std::shared_ptr<CacheBackend> backend, const CacheConfig &c)
    : backend_(std::move(backend)), cfg_(c)
{
  if (!backend_)
    backend_ = std::make_shared<MemoryCacheBackend>();
}

std::string ForecastCache::key(const std::string &location_id, EpochSeconds bucket)
{
  return location_prefix(location_id) + format_hour_key(bucket);
}

std::optional<ForecastSet> ForecastCache::lookup(const std::string &key, bool &degraded)
{
  try
  {
    return backend_->get(key);
  }
  catch (const CacheUnavailable &e)
  {
    degraded = true;
    degraded_.fetch_add(1, std::memory_order_relaxed);
    LOG_WARN("cache: lookup %s failed, computing uncached: %s", key.c_str(), e.what());
    return std::nullopt;
  }
}

void ForecastCache::store(const std::string &key, const ForecastSet &value, bool &degraded)
{
  try
  {
    backend_->set(key, value, cfg_.ttl_sec);
  }
  catch (const CacheUnavailable &e)
  {
    degraded = true;
    degraded_.fetch_add(1, std::memory_order_relaxed);
    LOG_WARN("cache: store %s failed, result served uncached: %s", key.c_str(), e.what());
  }
  catch (const std::exception &e)
  {
    degraded = true;
    degraded_.fetch_add(1, std::memory_order_relaxed);
    LOG_ERROR("cache: backend error storing %s, result served uncached: %s", key.c_str(), e.what());
  }
}

void ForecastCache::release(const std::string &key)
{
  std::lock_guard<std::mutex> g(mu_);
  inflight_.erase(key);
  ++published_;
}

ForecastSet ForecastCache::get_or_compute(const std::string &location_id,
                                          EpochSeconds bucket,
                                          const ComputeFn &compute_fn,
                                          CacheOutcome *outcome)
{
  const std::string k = key(location_id, hour_bucket(bucket));
  CacheOutcome local;
  CacheOutcome &oc = outcome ? *outcome : local;
  oc = CacheOutcome{};

  auto join = [&](std::shared_future<ForecastSet> f)
  {
    shared_.fetch_add(1, std::memory_order_relaxed);
    oc.shared = true;
    return f.get();
  };

  std::promise<ForecastSet> promise;
  for (;;)
  {
    uint64_t seen = 0;
    {
      std::unique_lock<std::mutex> lk(mu_);
      auto it = inflight_.find(k);
      if (it != inflight_.end())
      {
        std::shared_future<ForecastSet> f = it->second;
        lk.unlock();
        return join(std::move(f));
      }
      seen = published_;
    }

    // The backend may be remote; mu_ is not held across the lookup.
    if (auto hit = lookup(k, oc.degraded))
    {
      hits_.fetch_add(1, std::memory_order_relaxed);
      oc.hit = true;
      return std::move(*hit);
    }

    std::unique_lock<std::mutex> lk(mu_);
    auto it = inflight_.find(k);
    if (it != inflight_.end())
    {
      std::shared_future<ForecastSet> f = it->second;
      lk.unlock();
      return join(std::move(f));
    }
    // A computation finished during the lookup; its result may now be stored.
    if (published_ != seen)
      continue;
    misses_.fetch_add(1, std::memory_order_relaxed);
    inflight_.emplace(k, promise.get_future().share());
    break;
  }

  computations_.fetch_add(1, std::memory_order_relaxed);
  oc.computed = true;

  ForecastSet result;
  try
  {
    result = compute_fn();
  }
  catch (...)
  {
    failures_.fetch_add(1, std::memory_order_relaxed);
    release(k);
    promise.set_exception(std::current_exception());
    throw;
  }

  if (result.empty())
    LOG_DEBUG("cache: %s computed an empty set, not stored", k.c_str());
  else if (result.has_transient_failure())
    LOG_DEBUG("cache: %s has budget failures, not stored", k.c_str());
  else
    store(k, result, oc.degraded);

  release(k);
  promise.set_value(result);
  return result;
}

void ForecastCache::invalidate(const std::string &location_id, EpochSeconds bucket)
{
  const std::string k = key(location_id, hour_bucket(bucket));
  try
  {
    backend_->erase(k);
  }
  catch (const CacheUnavailable &e)
  {
    degraded_.fetch_add(1, std::memory_order_relaxed);
    LOG_WARN("cache: invalidate %s failed: %s", k.c_str(), e.what());
  }
}

size_t ForecastCache::invalidate_location(const std::string &location_id)
{
  try
  {
    const size_t n = backend_->erase_prefix(location_prefix(location_id));
    LOG_DEBUG("cache: cleared %zu entries for %s", n, location_id.c_str());
    return n;
  }
  catch (const CacheUnavailable &e)
  {
    degraded_.fetch_add(1, std::memory_order_relaxed);
    LOG_WARN("cache: clear %s failed: %s", location_id.c_str(), e.what());
    return 0;
  }
}

size_t ForecastCache::purge_expired()
{
  try
  {
    return backend_->purge_expired();
  }
  catch (const CacheUnavailable &e)
  {
    degraded_.fetch_add(1, std::memory_order_relaxed);
    LOG_WARN("cache: purge failed: %s", e.what());
    return 0;
  }
}

CacheStats ForecastCache::stats() const
{
  CacheStats s;
  s.hits = hits_.load(std::memory_order_relaxed);
  s.misses = misses_.load(std::memory_order_relaxed);
  s.computations = computations_.load(std::memory_order_relaxed);
  s.shared = shared_.load(std::memory_order_relaxed);
  s.failures = failures_.load(std::memory_order_relaxed);
  s.degraded = degraded_.load(std::memory_order_relaxed);
  return s;
}
