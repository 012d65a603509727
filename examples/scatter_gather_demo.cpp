// Copyright (c) 2024 liudegui. MIT License.
//
// scatter_gather_demo.cpp -- ScatterGather walkthrough.
//
// Demonstrates:
//   1. Fan-out over a simulated backend with a bounded concurrency limit
//   2. FailFast vs FailSoft on the same flaky input
//   3. Limit scaling comparison (1/2/4/8 in flight)
//   4. Async units completed from a timer thread
//   5. Caller cancellation
//   6. Engine settings from a config file (optional argv[1])
//
// Usage: scatter_gather_demo [engine.ini|engine.json|engine.yaml]

#include "sg/config.hpp"
#include "sg/engine_config.hpp"
#include "sg/log.hpp"
#include "sg/scatter_gather.hpp"
#include "sg/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <thread>
#include <vector>

// ============================================================================
// Simulated backend
// ============================================================================

struct Request {
  uint32_t id;
  uint32_t latency_ms;
};

static std::vector<Request> MakeRequests(uint32_t n, uint32_t latency_ms) {
  std::vector<Request> out;
  for (uint32_t i = 0; i < n; ++i) {
    out.push_back(Request{i, latency_ms});
  }
  return out;
}

// Every 7th request fails.
static sg::expected<uint32_t, sg::Cause> Fetch(const Request& req) {
  std::this_thread::sleep_for(std::chrono::milliseconds(req.latency_ms));
  if (req.id % 7U == 6U) {
    return sg::expected<uint32_t, sg::Cause>::error(sg::Cause::WorkUnit(503, "backend unavailable"));
  }
  return sg::expected<uint32_t, sg::Cause>::success(req.id * 3U);
}

static void PrintResult(const char* label, const sg::RunResult<sg::Tally<uint32_t>>& r) {
  if (r.Completed()) {
    printf("  %-10s: completed, sum=%u ok=%u failed=%u, peak %u/%u, %llu us\n", label,
           r.aggregate.value().sum, r.aggregate.value().successes, r.aggregate.value().failures,
           r.stats.peak_in_flight, r.stats.concurrency_limit,
           static_cast<unsigned long long>(r.elapsed_us));
  } else {
    printf("  %-10s: failed (%s) at item %u: %s, %u/%u retired\n", label,
           sg::ErrorKindName(r.cause.kind), r.cause.item_index, r.cause.message.c_str(),
           r.stats.retired, r.stats.total);
  }
}

// ============================================================================
// Demo 1: Bounded fan-out
// ============================================================================

static std::atomic<uint32_t> g_peak_seen{0};

static void OnAdmit(uint32_t /*index*/, uint32_t in_flight, void* /*ctx*/) {
  uint32_t prev = g_peak_seen.load();
  while (in_flight > prev && !g_peak_seen.compare_exchange_weak(prev, in_flight)) {
  }
}

static void DemoFanOut(sg::ThreadPool& pool, const sg::RunOptions& base) {
  printf("\n=== Demo 1: Bounded Fan-Out ===\n");
  g_peak_seen.store(0);

  sg::RunOptions opts = base;
  opts.name = "fan_out";
  opts.failure_policy = sg::FailurePolicy::kFailSoft;
  opts.on_admit = &OnAdmit;

  auto run = sg::ScatterGather(pool, MakeRequests(24, 5), opts, &Fetch, sg::Tally<uint32_t>(),
                               sg::TallyCombiner<uint32_t>());
  if (!run) {
    printf("  rejected: invalid concurrency limit %d\n", static_cast<int>(opts.concurrency_limit));
    return;
  }
  PrintResult("fan_out", run.value().Result());
  printf("  admit hook saw at most %u in flight\n", g_peak_seen.load());
}

// ============================================================================
// Demo 2: FailFast vs FailSoft
// ============================================================================

static void DemoPolicies(sg::ThreadPool& pool, const sg::RunOptions& base) {
  printf("\n=== Demo 2: FailFast vs FailSoft ===\n");

  for (sg::FailurePolicy policy : {sg::FailurePolicy::kFailFast, sg::FailurePolicy::kFailSoft}) {
    sg::RunOptions opts = base;
    opts.failure_policy = policy;
    opts.name.assign(sg::TruncateToCapacity,
                     policy == sg::FailurePolicy::kFailFast ? "fail_fast" : "fail_soft");

    auto run = sg::ScatterGather(pool, MakeRequests(14, 2), opts, &Fetch, sg::Tally<uint32_t>(),
                                 sg::TallyCombiner<uint32_t>());
    if (!run) {
      continue;
    }
    auto handle = run.value();
    PrintResult(opts.name.c_str(), handle.Result());
    // give stragglers time to arrive after a fail-fast abort
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    printf("  %-10s: %u late outcomes discarded\n", opts.name.c_str(), handle.Discarded());
  }
}

// ============================================================================
// Demo 3: Limit Scaling
// ============================================================================

static void DemoScaling(sg::ThreadPool& pool) {
  printf("\n=== Demo 3: Limit Scaling (16 x 10 ms) ===\n");

  for (int32_t limit : {1, 2, 4, 8}) {
    sg::RunOptions opts;
    opts.concurrency_limit = limit;
    opts.failure_policy = sg::FailurePolicy::kFailSoft;
    opts.name = "scaling";

    auto run = sg::ScatterGather(pool, MakeRequests(16, 10), opts, &Fetch,
                                 sg::Tally<uint32_t>(), sg::TallyCombiner<uint32_t>());
    if (!run) {
      continue;
    }
    const auto& r = run.value().Result();
    printf("  limit=%d : %6llu us  (peak %u)\n", static_cast<int>(limit),
           static_cast<unsigned long long>(r.elapsed_us), r.stats.peak_in_flight);
  }
}

// ============================================================================
// Demo 4: Async Units
// ============================================================================

static void DemoAsync(sg::ThreadPool& pool) {
  printf("\n=== Demo 4: Async Units ===\n");

  // A timer thread resolves completers, standing in for an I/O reactor.
  std::mutex mtx;
  std::vector<sg::Completer<uint32_t>> pending;
  std::atomic<bool> stop{false};
  std::thread timer([&] {
    while (!stop.load()) {
      std::vector<sg::Completer<uint32_t>> ready;
      {
        std::lock_guard<std::mutex> lk(mtx);
        ready.swap(pending);
      }
      for (auto& done : ready) {
        (void)done.Succeed(done.Index() + 100U);
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });

  auto unit = sg::MakeAsyncUnit<uint32_t>(
      [&mtx, &pending](const Request&, const sg::CancelToken&, sg::Completer<uint32_t> done) {
        std::lock_guard<std::mutex> lk(mtx);
        pending.push_back(std::move(done));
      });

  sg::RunOptions opts;
  opts.concurrency_limit = 6;
  opts.name = "async";
  auto run = sg::ScatterGather(pool, MakeRequests(30, 0), opts, unit, sg::Tally<uint32_t>(),
                               sg::TallyCombiner<uint32_t>());
  if (run) {
    PrintResult("async", run.value().Result());
  }
  stop.store(true);
  timer.join();
}

// ============================================================================
// Demo 5: Cancellation
// ============================================================================

static void DemoCancel(sg::ThreadPool& pool) {
  printf("\n=== Demo 5: Caller Cancellation ===\n");

  std::atomic<uint32_t> observed{0};
  auto unit = [&observed](const Request& req, const sg::CancelToken& token) {
    for (uint32_t slice = 0; slice < req.latency_ms; ++slice) {
      if (token.IsCancelled()) {
        observed.fetch_add(1);
        return sg::expected<uint32_t, sg::Cause>::error(
            sg::Cause::Make(sg::ErrorKind::kCancelled, 0, "stopped early"));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return sg::expected<uint32_t, sg::Cause>::success(req.id);
  };

  sg::RunOptions opts;
  opts.concurrency_limit = 3;
  opts.name = "cancel";
  auto run = sg::ScatterGather(pool, MakeRequests(12, 50), opts, unit, sg::Tally<uint32_t>(),
                               sg::TallyCombiner<uint32_t>());
  if (!run) {
    return;
  }
  auto handle = run.value();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  printf("  Cancel() -> %s\n", handle.Cancel() ? "accepted" : "already done");
  PrintResult("cancel", handle.Result());
  (void)pool.WaitIdle(1000000U);
  printf("  units that saw the token: %u\n", observed.load());
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  sg::ConfigStore defaults;
  (void)defaults.Set("pool", "name", "demo");
  (void)defaults.Set("pool", "workers", "8");
  (void)defaults.Set("run", "concurrency_limit", "4");

  const sg::ConfigStore* store = &defaults;
#if defined(SG_CONFIG_INI_ENABLED) || defined(SG_CONFIG_JSON_ENABLED) || \
    defined(SG_CONFIG_YAML_ENABLED)
  sg::MultiConfig file_cfg;
  if (argc > 1) {
    auto loaded = file_cfg.LoadFile(argv[1]);
    if (!loaded) {
      fprintf(stderr, "cannot load %s\n", argv[1]);
      return 1;
    }
    store = &file_cfg;
  }
#else
  if (argc > 1) {
    fprintf(stderr, "no config backend compiled in, ignoring %s\n", argv[1]);
  }
#endif

  auto engine = sg::LoadEngineConfig(*store);
  if (!engine) {
    fprintf(stderr, "invalid engine settings\n");
    return 1;
  }
  sg::log::SetLevel(engine.value().log_level);

  printf("=== ScatterGather Demo ===\n");
  printf("  pool '%s': %u workers, run limit %d\n", engine.value().pool.name.c_str(),
         engine.value().pool.worker_num, static_cast<int>(engine.value().run.concurrency_limit));

  sg::ThreadPool pool(engine.value().pool);
  pool.Start();

  DemoFanOut(pool, engine.value().run);
  DemoPolicies(pool, engine.value().run);
  DemoScaling(pool);
  DemoAsync(pool);
  DemoCancel(pool);

  auto stats = pool.GetStats();
  pool.Shutdown();
  printf("\n  pool: posted=%llu processed=%llu rejected=%llu peak_busy=%u\n",
         static_cast<unsigned long long>(stats.posted),
         static_cast<unsigned long long>(stats.processed),
         static_cast<unsigned long long>(stats.rejected), stats.peak_busy_workers);
  printf("\n=== Demo Complete ===\n");
  return 0;
}
