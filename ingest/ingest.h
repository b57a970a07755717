// ingest/ingest.h
#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "common/schema.h"

// Read side of the ingestion collaborator. The engine never writes through it.
class ObservationSource
{
public:
  virtual ~ObservationSource() = default;

  virtual std::optional<Observation> latest(const std::string &location_id) const = 0;
  // Up to `count` observations, most-recent-first.
  virtual std::vector<Observation> history(const std::string &location_id, size_t count) const = 0;
  virtual std::vector<std::string> locations() const = 0;
};

// In-process store keyed by location, kept sorted by timestamp.
class MemoryObservationStore : public ObservationSource
{
public:
  void record(const Observation &obs);
  void clear();
  [[nodiscard]] size_t size() const;

  std::optional<Observation> latest(const std::string &location_id) const override;
  std::vector<Observation> history(const std::string &location_id, size_t count) const override;
  std::vector<std::string> locations() const override;

private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<Observation>> by_loc_;
};

struct IngestConfig
{
  uint32_t locations = 8;
  uint32_t hours = 48;        // hourly readings generated per location
  double base_lat = 37.0;     // locations spread over a 1x1 degree box
  double base_lon = -122.5;
  double missing_ratio = 0.1; // chance that an optional field is not reported
  uint32_t seed = 12345;
};

// Synthetic feed with a diurnal congestion pattern, for drivers and tests.
class SyntheticIngestor
{
public:
  explicit SyntheticIngestor(const IngestConfig &cfg);

  static std::string location_name(uint32_t idx);

  // One reading per location for the hour starting at `ts`.
  void generate(EpochSeconds ts, std::vector<Observation> &out);
  // `cfg.hours` consecutive hourly readings ending at `end_ts`.
  void fill(MemoryObservationStore &store, EpochSeconds end_ts);

private:
  IngestConfig cfg_;
  std::mt19937 rng_;
  std::vector<std::pair<double, double>> coords_;

  template <typename T>
  std::optional<T> maybe(T v);
};
