// dist/main.cpp
#include <mpi.h>
#include <vector>
#include <map>
#include <algorithm>
#include <cstdio>
#include <cstdint>
#include <string>
#include <thread>
#include <chrono>

#include "common/config.h"
#include "common/ids.h"
#include "common/log.h"
#include "common/schema.h"
#include "common/timers.h"
#include "forecast/app.h"
#include "model/bundle.h"

// Whole hourly batch must land within this budget on the coordinator.
static constexpr uint32_t BUDGET_BATCH_MS = 120000;

static void send_bundle(const std::string &doc, int dst)
{
  long long n = static_cast<long long>(doc.size());
  MPI_Send(&n, 1, MPI_LONG_LONG, dst, TAG_MODEL, MPI_COMM_WORLD);
  if (n > 0)
    MPI_Send(doc.data(), static_cast<int>(n), MPI_CHAR, dst, TAG_MODEL, MPI_COMM_WORLD);
}

static std::string recv_bundle()
{
  long long n = 0;
  MPI_Recv(&n, 1, MPI_LONG_LONG, 0, TAG_MODEL, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
  std::string doc(static_cast<size_t>(std::max(n, 0LL)), '\0');
  if (n > 0)
    MPI_Recv(doc.data(), static_cast<int>(n), MPI_CHAR, 0, TAG_MODEL, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
  return doc;
}

static void append_wire(const ForecastSet &set, uint32_t loc_idx, std::vector<ForecastWire> &out)
{
  for (const auto &p : set.points)
  {
    out.push_back(ForecastWire{
        loc_idx,
        p.horizon_hours,
        p.target_time,
        static_cast<float>(p.congestion),
        static_cast<float>(p.confidence),
        static_cast<float>(p.horizon_confidence),
        static_cast<float>(p.current_speed),
        static_cast<uint8_t>(p.level),
        0});
  }
  for (const auto &f : set.failures)
  {
    ForecastWire w{};
    w.location_index = loc_idx;
    w.horizon_hours = f.horizon_hours;
    w.target_time = set.as_of + static_cast<EpochSeconds>(f.horizon_hours) * kSecPerHour;
    w.failed = static_cast<uint8_t>(static_cast<uint8_t>(f.kind) + 1);
    out.push_back(w);
  }
}

int main(int argc, char **argv)
{
  MPI_Init(&argc, &argv);
  int world = 0, rank = 0;
  MPI_Comm_size(MPI_COMM_WORLD, &world);
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  if (world < 2)
  {
    std::fprintf(stderr, "FATAL: need >=2 ranks\n");
    MPI_Abort(MPI_COMM_WORLD, 1);
  }
  const int P = world - 1;

  AppConfig cfg = load_config_from_env();
  const uint32_t budget_ms = env_u32("BATCH_BUDGET_MS", BUDGET_BATCH_MS);
  ForecastApp app(cfg);

  // Every rank replays the same seeded feed, so location order agrees.
  const EpochSeconds as_of = hour_bucket(system_now());
  app.seed_observations(as_of);
  const std::vector<std::string> locs = app.store().locations();

  if (rank == 0)
  {
    log_config(cfg);
    std::fprintf(stderr, "[BOOT] world=%d, forecasters=%d, locations=%zu\n", world, P, locs.size());
    std::fflush(stderr);
  }

  // ---- model distribution -------------------------------------------------
  int model_ok = 1;
  if (role_for_rank(rank) == Role::Coordinator)
  {
    std::string doc;
    try
    {
      ModelSnapshot m = app.bootstrap();
      doc = bundle_to_json(*m).dump();
    }
    catch (const std::exception &e)
    {
      LOG_ERROR("coordinator has no model: %s", e.what());
      model_ok = 0;
    }
    MPI_Bcast(&model_ok, 1, MPI_INT, 0, MPI_COMM_WORLD);
    if (model_ok)
      for (int r = 1; r <= P; ++r)
        send_bundle(doc, r);
  }
  else
  {
    MPI_Bcast(&model_ok, 1, MPI_INT, 0, MPI_COMM_WORLD);
    if (model_ok)
    {
      try
      {
        app.predictor().load(bundle_from_json(nlohmann::json::parse(recv_bundle())));
      }
      catch (const std::exception &e)
      {
        LOG_ERROR("rank %d: bad model bundle: %s", rank, e.what());
        MPI_Abort(MPI_COMM_WORLD, 2);
      }
    }
  }
  if (!model_ok)
  {
    MPI_Finalize();
    return 1;
  }

  if (role_for_rank(rank) == Role::Forecaster)
  {
    int slice[2] = {0, 0};
    MPI_Recv(slice, 2, MPI_INT, 0, TAG_WORK, MPI_COMM_WORLD, MPI_STATUS_IGNORE);

    Deadline dl{.start_ms = now_ms(), .budget_ms = budget_ms};
    std::vector<ForecastWire> wires;
    uint32_t failed_locs = 0;
    for (int i = slice[0]; i < slice[1]; ++i)
    {
      ForecastRequest req;
      req.location_id = locs[static_cast<size_t>(i)];
      req.as_of = as_of;
      try
      {
        append_wire(app.service().forecast(req).set, static_cast<uint32_t>(i), wires);
      }
      catch (const ForecastError &e)
      {
        ++failed_locs;
        LOG_WARN("rank %d: %s: %s", rank, req.location_id.c_str(), e.what());
      }
      catch (const std::exception &e)
      {
        ++failed_locs;
        LOG_ERROR("rank %d: %s failed: %s", rank, req.location_id.c_str(), e.what());
      }
      if (dl.expired())
      {
        LOG_WARN("rank %d: batch budget spent after %d of %d locations", rank, i - slice[0] + 1, slice[1] - slice[0]);
        failed_locs += static_cast<uint32_t>(slice[1] - i - 1);
        break;
      }
    }

    int n = static_cast<int>(wires.size());
    MPI_Send(&n, 1, MPI_INT, 0, TAG_FCST, MPI_COMM_WORLD);
    if (n > 0)
      MPI_Send(wires.data(), n * static_cast<int>(sizeof(ForecastWire)), MPI_BYTE, 0, TAG_FCST, MPI_COMM_WORLD);
    uint32_t stat[2] = {failed_locs, dl.elapsed()};
    MPI_Send(stat, 2, MPI_UNSIGNED, 0, TAG_STAT, MPI_COMM_WORLD);
  }
  else
  {
    const ModelSnapshot model = app.predictor().snapshot();
    const int total = static_cast<int>(locs.size());
    int per = total / P, cursor = 0;
    for (int p = 0; p < P; ++p)
    {
      int slice[2] = {cursor, (p == P - 1) ? total : cursor + per};
      MPI_Send(slice, 2, MPI_INT, p + 1, TAG_WORK, MPI_COMM_WORLD);
      cursor = slice[1];
    }

    uint64_t t0 = now_ms();
    uint64_t end = t0 + budget_ms;
    std::vector<ForecastWire> all;
    int received = 0;
    uint32_t failed_locs = 0;
    while (received < P && now_ms() < end)
    {
      int flag = 0;
      MPI_Status st;
      MPI_Iprobe(MPI_ANY_SOURCE, TAG_FCST, MPI_COMM_WORLD, &flag, &st);
      if (!flag)
      {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      int n = 0;
      MPI_Recv(&n, 1, MPI_INT, st.MPI_SOURCE, TAG_FCST, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
      size_t off = all.size();
      all.resize(off + static_cast<size_t>(std::max(n, 0)));
      if (n > 0)
        MPI_Recv(all.data() + off, n * static_cast<int>(sizeof(ForecastWire)), MPI_BYTE, st.MPI_SOURCE,
                 TAG_FCST, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
      uint32_t stat[2] = {0, 0};
      MPI_Recv(stat, 2, MPI_UNSIGNED, st.MPI_SOURCE, TAG_STAT, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
      failed_locs += stat[0];
      LOG_INFO("rank %d: %d records, %u failed locations, %ums", st.MPI_SOURCE, n, stat[0], stat[1]);
      received++;
    }
    const bool complete = received == P;

    // Reassemble per-location sets from the flat records.
    std::map<uint32_t, ForecastSet> sets;
    for (const auto &w : all)
    {
      if (w.location_index >= locs.size())
        continue;
      ForecastSet &s = sets[w.location_index];
      if (s.location_id.empty())
      {
        s.location_id = locs[w.location_index];
        s.as_of = as_of;
        s.bucket = hour_bucket(as_of);
        s.model_id = model->model_id;
        s.model_version = model->version;
      }
      if (w.failed)
      {
        s.failures.push_back({w.horizon_hours, static_cast<HorizonFailureKind>(w.failed - 1), "reported by forecaster"});
        continue;
      }
      ForecastPoint p;
      p.target_time = w.target_time;
      p.horizon_hours = w.horizon_hours;
      p.congestion = w.congestion;
      p.level = w.level;
      p.confidence = w.confidence;
      p.horizon_confidence = w.horizon_confidence;
      p.current_speed = w.current_speed;
      p.speed_reduction_percent = w.congestion * cfg.pred.max_speed_reduction;
      p.model = model->model_id;
      s.points.push_back(std::move(p));
    }

    std::vector<ForecastSet> batch;
    batch.reserve(sets.size());
    for (auto &kv : sets)
    {
      std::sort(kv.second.points.begin(), kv.second.points.end(),
                [](const ForecastPoint &a, const ForecastPoint &b)
                { return a.horizon_hours < b.horizon_hours; });
      batch.push_back(std::move(kv.second));
    }

    std::vector<AlertDecision> alerts;
    app.alerts().decide(batch, alerts);

    // Worst next-hour location, if any.
    std::string top = "-";
    double top_c = -1.0;
    for (const auto &s : batch)
      if (!s.points.empty() && s.points.front().congestion > top_c)
      {
        top_c = s.points.front().congestion;
        top = s.location_id;
      }

    long long lat = (long long)(now_ms() - t0);
    std::printf("[COORD] slices %d/%d | locations %zu/%zu | failed=%u | records=%zu | alerts=%zu | top=%s (%.1f%%) | lat=%lldms\n",
                received, P, batch.size(), locs.size(), failed_locs, all.size(), alerts.size(),
                top.c_str(), std::max(top_c, 0.0), lat);
    for (const auto &a : alerts)
      std::printf("[ALERT] %s +%dh L%d %.1f%% conf %.2f %s\n", a.location_id.c_str(), a.horizon_hours,
                  a.level, a.congestion, a.confidence, alert_reason_name(a.reason));
    std::fflush(stdout);
    if (!complete)
    {
      LOG_ERROR("batch incomplete: %d of %d forecasters reported", received, P);
      MPI_Abort(MPI_COMM_WORLD, 3);
    }
  }

  MPI_Finalize();
  return 0;
}
