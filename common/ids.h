// common/ids.h
#pragma once
#include <cstdint>

// Message tags (MPI)
inline constexpr int TAG_MODEL = 10; // serialized model bundle broadcast
inline constexpr int TAG_WORK = 11;  // location slice assignment
inline constexpr int TAG_FCST = 12;  // ForecastWire results
inline constexpr int TAG_STAT = 13;  // per-rank counters

// Roles for MPI ranks
enum class Role : int
{
  Coordinator = 0, // trains/loads the bundle, collects forecasts, evaluates alerts
  Forecaster = 1   // every other rank scores its slice of locations
};

inline Role role_for_rank(int rank) { return rank == 0 ? Role::Coordinator : Role::Forecaster; }
