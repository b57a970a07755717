// ingest/ingest.cpp
#include "ingest/ingest.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

void MemoryObservationStore::record(const Observation &obs)
{
  std::lock_guard<std::mutex> g(mu_);
  auto &v = by_loc_[obs.location_id];
  // Feeds are mostly in order; insert keeps the vector sorted either way.
  auto it = std::upper_bound(v.begin(), v.end(), obs.ts,
                             [](EpochSeconds t, const Observation &o) { return t < o.ts; });
  v.insert(it, obs);
}

void MemoryObservationStore::clear()
{
  std::lock_guard<std::mutex> g(mu_);
  by_loc_.clear();
}

size_t MemoryObservationStore::size() const
{
  std::lock_guard<std::mutex> g(mu_);
  size_t n = 0;
  for (const auto &kv : by_loc_)
    n += kv.second.size();
  return n;
}

std::optional<Observation> MemoryObservationStore::latest(const std::string &location_id) const
{
  std::lock_guard<std::mutex> g(mu_);
  auto it = by_loc_.find(location_id);
  if (it == by_loc_.end() || it->second.empty())
    return std::nullopt;
  return it->second.back();
}

std::vector<Observation> MemoryObservationStore::history(const std::string &location_id, size_t count) const
{
  std::lock_guard<std::mutex> g(mu_);
  std::vector<Observation> out;
  auto it = by_loc_.find(location_id);
  if (it == by_loc_.end())
    return out;
  const auto &v = it->second;
  const size_t n = std::min(count, v.size());
  out.reserve(n);
  for (size_t i = 0; i < n; ++i)
    out.push_back(v[v.size() - 1 - i]);
  return out;
}

std::vector<std::string> MemoryObservationStore::locations() const
{
  std::lock_guard<std::mutex> g(mu_);
  std::vector<std::string> out;
  out.reserve(by_loc_.size());
  for (const auto &kv : by_loc_)
    out.push_back(kv.first);
  return out;
}

SyntheticIngestor::SyntheticIngestor(const IngestConfig &cfg) : cfg_(cfg), rng_(cfg.seed)
{
  std::uniform_real_distribution<double> u(0.0, 1.0);
  coords_.reserve(cfg_.locations);
  for (uint32_t i = 0; i < cfg_.locations; ++i)
    coords_.emplace_back(cfg_.base_lat + u(rng_), cfg_.base_lon + u(rng_));
}

std::string SyntheticIngestor::location_name(uint32_t idx)
{
  char buf[24];
  std::snprintf(buf, sizeof(buf), "loc-%04u", idx);
  return buf;
}

template <typename T>
std::optional<T> SyntheticIngestor::maybe(T v)
{
  std::uniform_real_distribution<double> u(0.0, 1.0);
  if (u(rng_) < cfg_.missing_ratio)
    return std::nullopt;
  return v;
}

void SyntheticIngestor::generate(EpochSeconds ts, std::vector<Observation> &out)
{
  out.clear();
  out.reserve(cfg_.locations);

  std::uniform_int_distribution<int> base(0, 10);
  std::normal_distribution<double> noise(0.0, 1.0);
  std::uniform_real_distribution<double> u(0.0, 1.0);

  // simple diurnal pattern + noise
  const int hour = hour_of_day(ts);
  const int dow = day_of_week(ts);
  float peak = (hour >= 7 && hour <= 9) || (hour >= 17 && hour <= 19) ? 1.5f : 1.0f;
  if (hour >= 22 || hour <= 5)
    peak = 0.5f;
  if (dow >= 5)
    peak *= 0.7f;

  for (uint32_t j = 0; j < cfg_.locations; ++j)
  {
    Observation o{};
    o.location_id = location_name(j);
    o.lat = coords_[j].first;
    o.lon = coords_[j].second;
    o.ts = ts;

    const int b = base(rng_);
    const double n = noise(rng_) * 2.0;

    const int vehicles = std::max(0, static_cast<int>((80 + b * 8) * peak + n * 5));
    const double speed = std::max(5.0, 60.0 - 18.0 * (peak - 0.5) - b + n);
    const int level = std::clamp(static_cast<int>(std::lround(1.0 + 2.2 * peak + n * 0.3)), kLevelMin, kLevelMax);

    o.congestion_level = maybe(level);
    o.average_speed = maybe(speed);
    o.vehicle_count = maybe(vehicles);
    o.temperature = maybe(14.0 + 8.0 * std::sin((hour - 9) * 3.14159265 / 12.0) + n);
    o.precipitation = maybe(u(rng_) < 0.15 ? u(rng_) * 6.0 : 0.0);
    o.visibility = maybe(u(rng_) < 0.1 ? 2.0 + u(rng_) * 5.0 : 10.0);
    o.incident_reported = maybe(u(rng_) < 0.03);
    o.event_nearby = maybe(u(rng_) < 0.05);
    out.push_back(std::move(o));
  }
}

void SyntheticIngestor::fill(MemoryObservationStore &store, EpochSeconds end_ts)
{
  std::vector<Observation> batch;
  const EpochSeconds last = hour_bucket(end_ts);
  for (uint32_t h = cfg_.hours; h > 0; --h)
  {
    generate(last - static_cast<EpochSeconds>(h - 1) * kSecPerHour, batch);
    for (const auto &o : batch)
      store.record(o);
  }
}
