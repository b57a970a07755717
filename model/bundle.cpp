// model/bundle.cpp
#include "model/bundle.h"
#include <filesystem>
#include <fstream>
#include <system_error>
#include "common/log.h"

namespace fs = std::filesystem;

std::map<std::string, double> TrainedModel::feature_importance() const
{
  std::map<std::string, double> out;
  if (!stable || !reactive)
    return out;
  const auto a = stable->feature_importance();
  const auto b = reactive->feature_importance();
  double total = 0.0;
  for (size_t i = 0; i < feature_names.size(); ++i)
  {
    const double v = 0.5 * ((i < a.size() ? a[i] : 0.0) + (i < b.size() ? b[i] : 0.0));
    out[feature_names[i]] = v;
    total += v;
  }
  if (total > 0.0)
    for (auto &kv : out)
      kv.second /= total;
  return out;
}

nlohmann::json bundle_to_json(const TrainedModel &m)
{
  if (!m.complete())
    throw ModelArtifactError("refusing to serialize an incomplete model '" + m.model_id + "'");
  return {{"schema", m.version},
          {"model_id", m.model_id},
          {"created_at", m.created_at},
          {"feature_names", m.feature_names},
          {"scaler", m.scaler.to_json()},
          {"stable", m.stable->to_json()},
          {"reactive", m.reactive->to_json()},
          {"metrics", {{"mse", m.metrics.mse}, {"rmse", m.metrics.rmse}, {"mae", m.metrics.mae},
                       {"r2", m.metrics.r2}, {"train_rows", m.metrics.train_rows},
                       {"holdout_rows", m.metrics.holdout_rows}}}};
}

std::shared_ptr<const TrainedModel> bundle_from_json(const nlohmann::json &j)
{
  auto m = std::make_shared<TrainedModel>();
  try
  {
    const auto schema = j.at("schema").get<std::string>();
    if (schema != kBundleSchema)
      throw ModelArtifactError("unsupported bundle schema '" + schema + "'");
    m->version = schema;
    m->model_id = j.at("model_id").get<std::string>();
    m->created_at = j.value("created_at", EpochSeconds{0});
    m->feature_names = j.at("feature_names").get<std::vector<std::string>>();
    m->scaler = FeatureScaler::from_json(j.at("scaler"));
    m->stable = regressor_from_json(j.at("stable"));
    m->reactive = regressor_from_json(j.at("reactive"));
    if (j.contains("metrics"))
    {
      const auto &jm = j["metrics"];
      m->metrics.mse = jm.value("mse", 0.0);
      m->metrics.rmse = jm.value("rmse", 0.0);
      m->metrics.mae = jm.value("mae", 0.0);
      m->metrics.r2 = jm.value("r2", 0.0);
      m->metrics.train_rows = jm.value("train_rows", size_t{0});
      m->metrics.holdout_rows = jm.value("holdout_rows", size_t{0});
    }
  }
  catch (const nlohmann::json::exception &e)
  {
    throw ModelArtifactError(std::string("malformed model bundle: ") + e.what());
  }

  // The bundle must describe exactly the schema this build featurizes.
  const auto expected = feature_name_list();
  if (m->feature_names != expected)
    throw FeatureShapeError("bundle feature ordering does not match the feature schema (" +
                            std::to_string(m->feature_names.size()) + " vs " +
                            std::to_string(expected.size()) + " fields)");
  if (m->stable->n_features() != expected.size() || m->reactive->n_features() != expected.size())
    throw FeatureShapeError(expected.size(), m->stable->n_features());
  if (!m->complete())
    throw ModelArtifactError("model bundle '" + m->model_id + "' is incomplete");
  return m;
}

void save_bundle(const TrainedModel &m, const std::string &path)
{
  const std::string doc = bundle_to_json(m).dump();
  const fs::path target(path);
  if (target.has_parent_path())
  {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
      throw ModelArtifactError("cannot create " + target.parent_path().string() + ": " + ec.message());
  }

  const fs::path tmp = target.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      throw ModelArtifactError("cannot open " + tmp.string() + " for writing");
    out << doc;
    out.flush();
    if (!out)
    {
      out.close();
      std::error_code ignore;
      fs::remove(tmp, ignore);
      throw ModelArtifactError("short write to " + tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec)
  {
    std::error_code ignore;
    fs::remove(tmp, ignore);
    throw ModelArtifactError("cannot move bundle into place at " + path + ": " + ec.message());
  }
  LOG_INFO("saved model bundle %s (%zu bytes) to %s", m.model_id.c_str(), doc.size(), path.c_str());
}

std::shared_ptr<const TrainedModel> load_bundle(const std::string &path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw ModelArtifactError("no model bundle at " + path);

  nlohmann::json j;
  try
  {
    in >> j;
  }
  catch (const nlohmann::json::exception &e)
  {
    throw ModelArtifactError("model bundle at " + path + " is not valid JSON: " + e.what());
  }
  auto m = bundle_from_json(j);
  LOG_INFO("loaded model bundle %s from %s", m->model_id.c_str(), path.c_str());
  return m;
}
