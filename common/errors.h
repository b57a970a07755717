// common/errors.h
#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// How a caller should react to a failure.
enum class ErrorClass : int
{
  RetryLater = 0,  // model not loaded, artifact missing, no observation yet
  FixCaller = 1,   // bad horizons, feature shape mismatch
  DataProblem = 2, // not enough training data
  Degraded = 3     // partial result or cache outage, request still served
};

inline const char *error_class_name(ErrorClass c)
{
  switch (c)
  {
  case ErrorClass::RetryLater:
    return "retry_later";
  case ErrorClass::FixCaller:
    return "fix_caller";
  case ErrorClass::DataProblem:
    return "data_problem";
  case ErrorClass::Degraded:
    return "degraded";
  }
  return "unknown";
}

class ForecastError : public std::runtime_error
{
public:
  ForecastError(ErrorClass cls, const std::string &what)
      : std::runtime_error(what), cls_(cls) {}

  [[nodiscard]] ErrorClass error_class() const { return cls_; }

private:
  ErrorClass cls_;
};

class ModelNotLoadedError : public ForecastError
{
public:
  explicit ModelNotLoadedError(const std::string &what = "no trained ensemble loaded")
      : ForecastError(ErrorClass::RetryLater, what) {}
};

class ModelArtifactError : public ForecastError
{
public:
  explicit ModelArtifactError(const std::string &what)
      : ForecastError(ErrorClass::RetryLater, what) {}
};

class FeatureShapeError : public ForecastError
{
public:
  FeatureShapeError(size_t expected, size_t got)
      : ForecastError(ErrorClass::FixCaller,
                      "feature vector has " + std::to_string(got) + " fields, model expects " +
                          std::to_string(expected)),
        expected_(expected), got_(got) {}

  explicit FeatureShapeError(const std::string &what)
      : ForecastError(ErrorClass::FixCaller, what) {}

  [[nodiscard]] size_t expected() const { return expected_; }
  [[nodiscard]] size_t got() const { return got_; }

private:
  size_t expected_ = 0;
  size_t got_ = 0;
};

class InvalidRequestError : public ForecastError
{
public:
  explicit InvalidRequestError(const std::string &what)
      : ForecastError(ErrorClass::FixCaller, what) {}
};

class ObservationUnavailable : public ForecastError
{
public:
  explicit ObservationUnavailable(const std::string &location_id)
      : ForecastError(ErrorClass::RetryLater, "no observation available for location '" + location_id + "'") {}
};

class TrainingDataInsufficient : public ForecastError
{
public:
  TrainingDataInsufficient(size_t have, size_t need)
      : ForecastError(ErrorClass::DataProblem,
                      "training needs at least " + std::to_string(need) + " samples, got " +
                          std::to_string(have)),
        have_(have), need_(need) {}

  explicit TrainingDataInsufficient(const std::string &what)
      : ForecastError(ErrorClass::DataProblem, what) {}

  [[nodiscard]] size_t have() const { return have_; }
  [[nodiscard]] size_t need() const { return need_; }

private:
  size_t have_ = 0;
  size_t need_ = 0;
};

// Raised by the cache backend; the cache itself never lets it escape.
class CacheUnavailable : public ForecastError
{
public:
  explicit CacheUnavailable(const std::string &what)
      : ForecastError(ErrorClass::Degraded, what) {}
};

// Only raised for callers that ask for a complete set.
class PartialHorizonFailure : public ForecastError
{
public:
  PartialHorizonFailure(const std::string &what, std::vector<int> failed)
      : ForecastError(ErrorClass::Degraded, what), failed_(std::move(failed)) {}

  [[nodiscard]] const std::vector<int> &failed_horizons() const { return failed_; }

private:
  std::vector<int> failed_;
};
