/**
 * @file test_scatter_gather.cpp
 * @brief End-to-end tests for sg::ScatterGather() and sg::Gather().
 *
 * Deterministic cases run on a ManualExecutor; concurrency and timing cases
 * run on a ThreadPool.
 */

#include "sg/scatter_gather.hpp"
#include "sg/thread_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::vector<int> Iota(int n) {
  std::vector<int> v;
  for (int i = 0; i < n; ++i) {
    v.push_back(i);
  }
  return v;
}

struct SumInts {
  void operator()(int& acc, const sg::Outcome<int>& o) const {
    if (o.Ok()) {
      acc += o.Value();
    }
  }
};

/// Records admissions reported through RunOptions::on_admit.
struct AdmitLog {
  std::mutex mtx;
  std::vector<uint32_t> order;
  uint32_t max_in_flight{0U};

  static void Hook(uint32_t index, uint32_t in_flight, void* ctx) {
    AdmitLog* self = static_cast<AdmitLog*>(ctx);
    std::lock_guard<std::mutex> lk(self->mtx);
    self->order.push_back(index);
    if (in_flight > self->max_in_flight) {
      self->max_in_flight = in_flight;
    }
  }
};

/// Counts units that are executing right now.
struct Gauge {
  std::atomic<int> current{0};
  std::atomic<int> peak{0};

  void Enter() {
    int now = current.fetch_add(1) + 1;
    int prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now)) {
    }
  }
  void Leave() { current.fetch_sub(1); }
};

/// Async unit that parks every completer for the test to resolve.
struct Parking {
  std::vector<sg::Completer<int>> completers;
  std::vector<sg::CancelToken> tokens;
};

auto ParkingUnit(Parking& lot) {
  return sg::MakeAsyncUnit<int>(
      [&lot](const int&, const sg::CancelToken& token, sg::Completer<int> done) {
        lot.tokens.push_back(token);
        lot.completers.push_back(std::move(done));
      });
}

}  // namespace

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Non-positive concurrency limit fails before any unit runs", "[scatter_gather]") {
  sg::ManualExecutor exec;
  int calls = 0;
  auto unit = [&calls](const int& x) {
    ++calls;
    return x;
  };

  for (int32_t limit : {0, -1}) {
    sg::RunOptions opts;
    opts.concurrency_limit = limit;
    auto run = sg::ScatterGather(exec, Iota(5), opts, unit, 0, SumInts());
    REQUIRE_FALSE(run.has_value());
    REQUIRE(run.get_error() == sg::EngineError::kInvalidConcurrencyLimit);
  }
  REQUIRE(exec.Pending() == 0U);
  REQUIRE(calls == 0);
}

TEST_CASE("Empty input completes immediately with the zero aggregate", "[scatter_gather]") {
  sg::ManualExecutor exec;
  auto run = sg::ScatterGather(exec, std::vector<int>(), sg::RunOptions(),
                               [](const int& x) { return x; }, 42, SumInts());
  REQUIRE(run.has_value());
  auto handle = run.value();
  REQUIRE(handle.IsDone());
  REQUIRE(exec.Pending() == 0U);

  const auto& r = handle.Result();
  REQUIRE(r.Completed());
  REQUIRE(r.aggregate.value() == 42);
  REQUIRE(r.stats.total == 0U);
  REQUIRE(r.stats.admitted == 0U);
  REQUIRE(r.elapsed_us < 100000U);
}

// ============================================================================
// Deterministic runs (ManualExecutor)
// ============================================================================

TEST_CASE("Run folds every item into the aggregate", "[scatter_gather]") {
  sg::ManualExecutor exec;
  sg::RunOptions opts;
  opts.concurrency_limit = 2;
  opts.name = "sum";

  auto run = sg::ScatterGather(exec, Iota(10), opts, [](const int& x) { return x * x; }, 0,
                               SumInts());
  REQUIRE(run.has_value());
  auto handle = run.value();
  REQUIRE_FALSE(handle.IsDone());  // nothing runs inside ScatterGather()

  exec.RunAll();
  REQUIRE(handle.IsDone());
  const auto& r = handle.Result();
  REQUIRE(r.status == sg::RunStatus::kCompleted);
  REQUIRE(r.aggregate.value() == 285);
  REQUIRE(r.stats.succeeded == 10U);
  REQUIRE(r.stats.failed == 0U);
  REQUIRE(r.stats.retired == 10U);
  REQUIRE(r.stats.peak_in_flight == 2U);
  REQUIRE(handle.Discarded() == 0U);
}

TEST_CASE("Admission follows input order and never exceeds the limit", "[scatter_gather]") {
  sg::ManualExecutor exec;
  AdmitLog admits;
  sg::RunOptions opts;
  opts.concurrency_limit = 3;
  opts.on_admit = &AdmitLog::Hook;
  opts.on_admit_ctx = &admits;

  std::vector<int> started;
  auto unit = [&started](const int& x) {
    started.push_back(x);
    return x;
  };
  auto run = sg::ScatterGather(exec, Iota(8), opts, unit, 0, SumInts());
  REQUIRE(run.has_value());

  // LIFO stepping completes items out of order.
  while (exec.RunNewest()) {
  }
  REQUIRE(run.value().Result().Completed());
  REQUIRE(admits.order == std::vector<uint32_t>{0U, 1U, 2U, 3U, 4U, 5U, 6U, 7U});
  REQUIRE(admits.max_in_flight == 3U);
  REQUIRE(started.size() == 8U);
}

TEST_CASE("Limit larger than the input admits every item at once", "[scatter_gather]") {
  sg::ManualExecutor exec;
  Parking lot;
  sg::RunOptions opts;
  opts.concurrency_limit = 100;

  auto run = sg::ScatterGather(exec, Iota(3), opts, ParkingUnit(lot), 0, SumInts());
  REQUIRE(run.has_value());
  exec.RunAll();
  REQUIRE(lot.completers.size() == 3U);

  for (auto& done : lot.completers) {
    REQUIRE(done.Succeed(1));
  }
  REQUIRE(run.value().Result().aggregate.value() == 3);
  REQUIRE(run.value().Result().stats.peak_in_flight == 3U);
}

TEST_CASE("Limit 1 runs items strictly one after another", "[scatter_gather]") {
  sg::ManualExecutor exec;
  Parking lot;
  sg::RunOptions opts;
  opts.concurrency_limit = 1;

  auto run = sg::ScatterGather(exec, Iota(4), opts, ParkingUnit(lot), 0, SumInts());
  REQUIRE(run.has_value());
  for (uint32_t i = 0U; i < 4U; ++i) {
    exec.RunAll();
    REQUIRE(lot.completers.size() == i + 1U);
    REQUIRE(lot.completers[i].Index() == i);
    REQUIRE(lot.completers[i].Succeed(10));
  }
  REQUIRE(run.value().Result().aggregate.value() == 40);
  REQUIRE(run.value().Result().stats.peak_in_flight == 1U);
}

// ============================================================================
// Failure policies
// ============================================================================

TEST_CASE("FailFast stops on the first failure and discards late outcomes",
          "[scatter_gather][fail_fast]") {
  sg::ManualExecutor exec;
  Parking lot;
  sg::RunOptions opts;
  opts.concurrency_limit = 3;
  opts.failure_policy = sg::FailurePolicy::kFailFast;

  auto run = sg::ScatterGather(exec, Iota(6), opts, ParkingUnit(lot), 0, SumInts());
  REQUIRE(run.has_value());
  auto handle = run.value();
  exec.RunAll();
  REQUIRE(lot.completers.size() == 3U);

  REQUIRE(lot.completers[1].Fail(sg::Cause::WorkUnit(503, "unavailable")));
  REQUIRE(handle.IsDone());

  const auto& r = handle.Result();
  REQUIRE(r.status == sg::RunStatus::kFailed);
  REQUIRE_FALSE(r.aggregate.has_value());
  REQUIRE(r.cause.kind == sg::ErrorKind::kWorkUnit);
  REQUIRE(r.cause.code == 503);
  REQUIRE(r.cause.item_index == 1U);
  REQUIRE(r.stats.admitted == 3U);

  // in-flight units observe cancellation; nothing new is admitted
  for (const auto& token : lot.tokens) {
    REQUIRE(token.IsCancelled());
  }
  REQUIRE(exec.RunAll() == 0U);

  REQUIRE(lot.completers[0].Succeed(5));
  REQUIRE(handle.Discarded() == 1U);
  lot.completers.clear();  // item 2 abandoned
  REQUIRE(handle.Discarded() == 2U);
  REQUIRE(handle.Result().status == sg::RunStatus::kFailed);
}

TEST_CASE("FailSoft gathers successes and failures", "[scatter_gather][fail_soft]") {
  sg::ManualExecutor exec;
  sg::RunOptions opts;
  opts.concurrency_limit = 4;
  opts.failure_policy = sg::FailurePolicy::kFailSoft;

  auto unit = [](const int& x) {
    if (x % 2 != 0) {
      return sg::expected<int, sg::Cause>::error(sg::Cause::WorkUnit(x, "odd"));
    }
    return sg::expected<int, sg::Cause>::success(x * 10);
  };
  auto run = sg::Gather(exec, Iota(10), opts, unit);
  REQUIRE(run.has_value());
  while (exec.RunNewest()) {
  }

  const auto& r = run.value().Result();
  REQUIRE(r.Completed());
  const auto& g = r.aggregate.value();
  REQUIRE(g.successes.size() == 5U);
  REQUIRE(g.failures.size() == 5U);
  for (uint32_t i = 0U; i < 5U; ++i) {
    REQUIRE(g.successes[i].index == 2U * i);
    REQUIRE(g.successes[i].value == static_cast<int>(20U * i));
    REQUIRE(g.failures[i].item_index == 2U * i + 1U);
    REQUIRE(g.failures[i].code == static_cast<int32_t>(2U * i + 1U));
  }
  REQUIRE(r.stats.failed == 5U);
  REQUIRE(r.stats.succeeded == 5U);
}

TEST_CASE("FailSoft with every item failing still completes", "[scatter_gather][fail_soft]") {
  sg::ManualExecutor exec;
  sg::RunOptions opts;
  opts.failure_policy = sg::FailurePolicy::kFailSoft;
  auto unit = [](const int&) {
    return sg::expected<int, sg::Cause>::error(sg::Cause::WorkUnit(1, "down"));
  };

  auto run = sg::ScatterGather(exec, Iota(6), opts, unit, sg::Tally<int>(),
                               sg::TallyCombiner<int>());
  REQUIRE(run.has_value());
  exec.RunAll();
  const auto& r = run.value().Result();
  REQUIRE(r.Completed());
  REQUIRE(r.aggregate.value().failures == 6U);
  REQUIRE(r.aggregate.value().successes == 0U);
}

#if SG_HAS_EXCEPTIONS
TEST_CASE("A throwing unit becomes a failed outcome", "[scatter_gather][exceptions]") {
  sg::ManualExecutor exec;
  sg::RunOptions opts;
  opts.failure_policy = sg::FailurePolicy::kFailSoft;
  auto unit = [](const int& x) -> int {
    if (x == 2) {
      throw std::runtime_error("bad item");
    }
    return x;
  };

  auto run = sg::Gather(exec, Iota(4), opts, unit);
  REQUIRE(run.has_value());
  exec.RunAll();
  const auto& g = run.value().Result().aggregate.value();
  REQUIRE(g.successes.size() == 3U);
  REQUIRE(g.failures.size() == 1U);
  REQUIRE(g.failures[0].item_index == 2U);
  REQUIRE(g.failures[0].message == "bad item");
}
#endif

TEST_CASE("Aggregation error fails the run under any policy", "[scatter_gather][aggregation]") {
  for (sg::FailurePolicy policy : {sg::FailurePolicy::kFailFast, sg::FailurePolicy::kFailSoft}) {
    sg::ManualExecutor exec;
    sg::RunOptions opts;
    opts.concurrency_limit = 2;
    opts.failure_policy = policy;

    auto combine = [](int& acc, const sg::Outcome<int>& o) {
      if (o.Index() == 4U) {
        return sg::expected<void, sg::Cause>::error(sg::Cause::WorkUnit(9, "overflow"));
      }
      acc += o.Value();
      return sg::expected<void, sg::Cause>::success();
    };
    auto run = sg::ScatterGather(exec, Iota(8), opts, [](const int& x) { return x; }, 0, combine);
    REQUIRE(run.has_value());
    exec.RunAll();

    const auto& r = run.value().Result();
    REQUIRE(r.status == sg::RunStatus::kFailed);
    REQUIRE(r.cause.kind == sg::ErrorKind::kAggregation);
    REQUIRE(r.cause.item_index == 4U);
    REQUIRE_FALSE(r.aggregate.has_value());
    REQUIRE(r.stats.admitted < 8U);
  }
}

// ============================================================================
// Cancellation and rejection
// ============================================================================

TEST_CASE("Caller cancel ends the run and signals in-flight units", "[scatter_gather][cancel]") {
  sg::ManualExecutor exec;
  Parking lot;
  sg::RunOptions opts;
  opts.concurrency_limit = 2;

  auto run = sg::ScatterGather(exec, Iota(5), opts, ParkingUnit(lot), 0, SumInts());
  REQUIRE(run.has_value());
  auto handle = run.value();
  exec.RunAll();
  REQUIRE(lot.completers.size() == 2U);
  REQUIRE_FALSE(handle.WaitFor(1000U));

  REQUIRE(handle.Cancel());
  REQUIRE(handle.IsDone());
  REQUIRE(handle.Result().status == sg::RunStatus::kFailed);
  REQUIRE(handle.Result().cause.kind == sg::ErrorKind::kCancelled);
  REQUIRE(lot.tokens[0].IsCancelled());
  REQUIRE_FALSE(handle.Cancel());

  REQUIRE(lot.completers[0].Succeed(1));
  REQUIRE(handle.Discarded() == 1U);
  REQUIRE(exec.RunAll() == 0U);
}

TEST_CASE("Executor refusing the run start fails the run", "[scatter_gather][rejected]") {
  sg::ManualExecutor exec;
  exec.SetRejecting(true);
  int calls = 0;
  auto unit = [&calls](const int& x) {
    ++calls;
    return x;
  };

  auto run = sg::ScatterGather(exec, Iota(3), sg::RunOptions(), unit, 0, SumInts());
  REQUIRE(run.has_value());
  REQUIRE(run.value().IsDone());
  REQUIRE(run.value().Result().cause.kind == sg::ErrorKind::kRejected);
  REQUIRE(calls == 0);
}

TEST_CASE("Rejected work units become failed outcomes", "[scatter_gather][rejected]") {
  sg::ManualExecutor exec;
  sg::RunOptions opts;
  opts.concurrency_limit = 2;

  SECTION("FailSoft accounts for every rejected item") {
    opts.failure_policy = sg::FailurePolicy::kFailSoft;
    auto run = sg::ScatterGather(exec, Iota(5), opts, [](const int& x) { return x; },
                                 sg::Tally<int>(), sg::TallyCombiner<int>());
    REQUIRE(run.has_value());
    exec.SetRejecting(true);
    REQUIRE(exec.RunOne());  // the run start task was accepted earlier

    const auto& r = run.value().Result();
    REQUIRE(r.Completed());
    REQUIRE(r.aggregate.value().failures == 5U);
    REQUIRE(r.stats.rejected == 5U);
  }

  SECTION("FailFast stops at the first rejection") {
    opts.failure_policy = sg::FailurePolicy::kFailFast;
    auto run = sg::ScatterGather(exec, Iota(5), opts, [](const int& x) { return x; }, 0,
                                 SumInts());
    REQUIRE(run.has_value());
    exec.SetRejecting(true);
    REQUIRE(exec.RunOne());

    const auto& r = run.value().Result();
    REQUIRE(r.status == sg::RunStatus::kFailed);
    REQUIRE(r.cause.kind == sg::ErrorKind::kRejected);
    REQUIRE(r.cause.item_index == 0U);
    REQUIRE(r.stats.rejected == 2U);
  }
}

// ============================================================================
// Completion callback
// ============================================================================

TEST_CASE("Then runs exactly once", "[scatter_gather][then]") {
  sg::ManualExecutor exec;
  int calls = 0;
  int seen = 0;

  auto run = sg::ScatterGather(exec, Iota(4), sg::RunOptions(), [](const int& x) { return x; }, 0,
                               SumInts());
  REQUIRE(run.has_value());
  auto handle = run.value();

  SECTION("registered before completion") {
    REQUIRE(handle.Then([&calls, &seen](const sg::RunResult<int>& r) {
      ++calls;
      seen = r.aggregate.value();
    }));
    REQUIRE_FALSE(handle.Then([&calls](const sg::RunResult<int>&) { ++calls; }));
    REQUIRE(calls == 0);
    exec.RunAll();
    REQUIRE(calls == 1);
    REQUIRE(seen == 6);
  }

  SECTION("registered after completion runs on the caller") {
    exec.RunAll();
    REQUIRE(handle.Then([&calls](const sg::RunResult<int>&) { ++calls; }));
    REQUIRE(calls == 1);
  }
}

#if SG_HAS_EXCEPTIONS
TEST_CASE("A throwing completion callback leaves the result intact", "[scatter_gather][then]") {
  sg::ManualExecutor exec;
  int calls = 0;

  auto run = sg::ScatterGather(exec, Iota(4), sg::RunOptions(), [](const int& x) { return x; }, 0,
                               SumInts());
  REQUIRE(run.has_value());
  auto handle = run.value();

  SECTION("on the finishing thread it is contained") {
    REQUIRE(handle.Then([&calls](const sg::RunResult<int>&) {
      ++calls;
      throw std::runtime_error("listener failed");
    }));
    exec.RunAll();
    REQUIRE(calls == 1);
    REQUIRE(handle.IsDone());
    REQUIRE(handle.Result().Completed());
    REQUIRE(handle.Result().aggregate.value() == 6);
    REQUIRE_FALSE(handle.Cancel());
  }

  SECTION("on the caller's thread it propagates") {
    exec.RunAll();
    REQUIRE_THROWS_AS(handle.Then([&calls](const sg::RunResult<int>&) {
                        ++calls;
                        throw std::runtime_error("listener failed");
                      }),
                      std::runtime_error);
    REQUIRE(calls == 1);
    REQUIRE(handle.Result().Completed());
  }
}
#endif

// ============================================================================
// Admission hook failures and abandoned runs
// ============================================================================

#if SG_HAS_EXCEPTIONS
namespace {

void RefusingHook(uint32_t index, uint32_t /*in_flight*/, void* ctx) {
  if (index == *static_cast<const uint32_t*>(ctx)) {
    throw std::runtime_error("quota exceeded");
  }
}

}  // namespace

TEST_CASE("A throwing admission hook fails the run on that item", "[scatter_gather][exceptions]") {
  for (sg::FoldMode mode : {sg::FoldMode::kChannel, sg::FoldMode::kMutex}) {
    // index 0 throws while handling the start event, index 1 while folding item 0
    for (uint32_t refused : {0U, 1U}) {
      sg::ManualExecutor exec;
      sg::RunOptions opts;
      opts.concurrency_limit = 1;
      opts.fold_mode = mode;
      opts.on_admit = &RefusingHook;
      opts.on_admit_ctx = &refused;

      int calls = 0;
      auto unit = [&calls](const int& x) {
        ++calls;
        return x;
      };
      auto run = sg::ScatterGather(exec, Iota(3), opts, unit, 0, SumInts());
      REQUIRE(run.has_value());
      auto handle = run.value();

      exec.RunAll();
      REQUIRE(exec.Pending() == 0U);
      REQUIRE(handle.IsDone());
      REQUIRE_FALSE(handle.Cancel());

      const auto& r = handle.Result();
      REQUIRE(r.status == sg::RunStatus::kFailed);
      REQUIRE(r.cause.kind == sg::ErrorKind::kWorkUnit);
      REQUIRE(r.cause.item_index == refused);
      REQUIRE(r.cause.message == "admission hook threw: quota exceeded");
      REQUIRE(r.stats.succeeded == refused);
      REQUIRE(calls == static_cast<int>(refused));
    }
  }
}
#endif

TEST_CASE("Dropping a run's pending tasks ends it as abandoned", "[scatter_gather][abandoned]") {
  auto exec = std::make_unique<sg::ManualExecutor>();
  Parking lot;
  sg::RunOptions opts;
  opts.concurrency_limit = 2;

  auto run = sg::ScatterGather(*exec, Iota(4), opts, ParkingUnit(lot), 0, SumInts());
  REQUIRE(run.has_value());
  auto handle = run.value();
  REQUIRE(exec->RunOne());  // start: admits items 0 and 1
  REQUIRE(exec->Pending() == 2U);
  REQUIRE_FALSE(handle.IsDone());

  exec.reset();
  REQUIRE(handle.IsDone());
  REQUIRE_FALSE(handle.Cancel());
  const auto& r = handle.Result();
  REQUIRE(r.status == sg::RunStatus::kFailed);
  REQUIRE(r.cause.kind == sg::ErrorKind::kAbandoned);
  REQUIRE(r.stats.admitted == 2U);
  REQUIRE(r.stats.retired == 0U);
  REQUIRE(lot.completers.empty());
}

// ============================================================================
// ThreadPool runs
// ============================================================================

TEST_CASE("In-flight units never exceed the limit on a thread pool", "[scatter_gather][pool]") {
  sg::ThreadPoolConfig cfg;
  cfg.name = "bound";
  cfg.worker_num = 8U;
  sg::ThreadPool pool(cfg);
  pool.Start();

  Gauge gauge;
  AdmitLog admits;
  sg::RunOptions opts;
  opts.concurrency_limit = 3;
  opts.failure_policy = sg::FailurePolicy::kFailSoft;
  opts.on_admit = &AdmitLog::Hook;
  opts.on_admit_ctx = &admits;

  auto unit = [&gauge](const int& x) {
    gauge.Enter();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    gauge.Leave();
    return x;
  };
  auto run = sg::ScatterGather(pool, Iota(40), opts, unit, 0, SumInts());
  REQUIRE(run.has_value());

  const auto& r = run.value().Result();
  REQUIRE(r.Completed());
  REQUIRE(r.aggregate.value() == 780);
  REQUIRE(gauge.peak.load() <= 3);
  REQUIRE(admits.max_in_flight <= 3U);
  REQUIRE(r.stats.peak_in_flight == 3U);
  std::lock_guard<std::mutex> lk(admits.mtx);
  REQUIRE(admits.order.size() == 40U);
  for (uint32_t i = 0U; i < 40U; ++i) {
    REQUIRE(admits.order[i] == i);
  }
  pool.Shutdown();
}

TEST_CASE("Both fold modes aggregate correctly under contention", "[scatter_gather][pool]") {
  sg::ThreadPoolConfig cfg;
  cfg.name = "fold";
  cfg.worker_num = 4U;
  sg::ThreadPool pool(cfg);
  pool.Start();

  for (sg::FoldMode mode : {sg::FoldMode::kChannel, sg::FoldMode::kMutex}) {
    sg::RunOptions opts;
    opts.concurrency_limit = 16;
    opts.fold_mode = mode;
    auto run = sg::ScatterGather(pool, Iota(1000), opts, [](const int& x) { return x; }, 0,
                                 SumInts());
    REQUIRE(run.has_value());
    const auto& r = run.value().Result();
    REQUIRE(r.Completed());
    REQUIRE(r.aggregate.value() == 499500);
    REQUIRE(r.stats.retired == 1000U);
  }
  pool.Shutdown();
}

TEST_CASE("Sequential and fully parallel runs agree", "[scatter_gather][pool]") {
  sg::ThreadPoolConfig cfg;
  cfg.name = "agree";
  cfg.worker_num = 4U;
  sg::ThreadPool pool(cfg);
  pool.Start();

  auto unit = [](const int& x) { return 3 * x + 1; };
  int sums[2] = {0, 0};
  const int32_t limits[2] = {1, 50};
  for (int i = 0; i < 2; ++i) {
    sg::RunOptions opts;
    opts.concurrency_limit = limits[i];
    auto run = sg::ScatterGather(pool, Iota(50), opts, unit, 0, SumInts());
    REQUIRE(run.has_value());
    REQUIRE(run.value().Result().Completed());
    sums[i] = run.value().Result().aggregate.value();
  }
  REQUIRE(sums[0] == sums[1]);
  REQUIRE(sums[0] == 3725);
  pool.Shutdown();
}

TEST_CASE("Elapsed time reflects the concurrency limit", "[scatter_gather][pool][timing]") {
  sg::ThreadPoolConfig cfg;
  cfg.name = "timing";
  cfg.worker_num = 4U;
  sg::ThreadPool pool(cfg);
  pool.Start();

  auto unit = [](const int& x) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return x;
  };

  SECTION("limit 4 runs 8 items in at least two waves") {
    sg::RunOptions opts;
    opts.concurrency_limit = 4;
    auto run = sg::ScatterGather(pool, Iota(8), opts, unit, 0, SumInts());
    REQUIRE(run.has_value());
    const auto& r = run.value().Result();
    REQUIRE(r.Completed());
    REQUIRE(r.elapsed_us >= 40000U);
    REQUIRE(r.stats.peak_in_flight == 4U);
  }

  SECTION("limit 1 serializes the items") {
    sg::RunOptions opts;
    opts.concurrency_limit = 1;
    auto run = sg::ScatterGather(pool, Iota(4), opts, unit, 0, SumInts());
    REQUIRE(run.has_value());
    const auto& r = run.value().Result();
    REQUIRE(r.Completed());
    REQUIRE(r.elapsed_us >= 80000U);
    REQUIRE(r.stats.peak_in_flight == 1U);
  }
  pool.Shutdown();
}

namespace {

/// Runs n items of fixed latency and returns the run's elapsed time.
uint64_t TimedRun(sg::ThreadPool& pool, int n, int32_t limit, int latency_ms) {
  auto unit = [latency_ms](const int& x) {
    std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms));
    return x;
  };
  sg::RunOptions opts;
  opts.concurrency_limit = limit;
  auto run = sg::ScatterGather(pool, Iota(n), opts, unit, 0, SumInts());
  REQUIRE(run.has_value());
  const auto& r = run.value().Result();
  REQUIRE(r.Completed());
  REQUIRE(r.stats.peak_in_flight <= static_cast<uint32_t>(limit));
  return r.elapsed_us;
}

}  // namespace

TEST_CASE("Elapsed time shrinks with the limit until it covers the input",
          "[scatter_gather][pool][timing]") {
  constexpr int kItems = 4;
  constexpr int kLatencyMs = 20;
  constexpr uint64_t kLatencyUs = kLatencyMs * 1000U;

  sg::ThreadPoolConfig cfg;
  cfg.name = "scaling";
  cfg.worker_num = 2U * kItems;
  sg::ThreadPool pool(cfg);
  pool.Start();

  const uint64_t k1 = TimedRun(pool, kItems, 1, kLatencyMs);
  const uint64_t k2 = TimedRun(pool, kItems, 2, kLatencyMs);
  const uint64_t kn = TimedRun(pool, kItems, kItems, kLatencyMs);
  const uint64_t k2n = TimedRun(pool, kItems, 2 * kItems, kLatencyMs);

  // 4, 2 and 1 waves of one latency each
  REQUIRE(k1 >= 4U * kLatencyUs);
  REQUIRE(k2 >= 2U * kLatencyUs);
  REQUIRE(kn >= kLatencyUs);
  REQUIRE(k1 > k2 + kLatencyUs / 2U);
  REQUIRE(k2 > kn + kLatencyUs / 2U);

  // Past N the limit no longer matters.
  REQUIRE(k2n >= kLatencyUs);
  REQUIRE(k2n < kn + kLatencyUs);
  REQUIRE(kn < k2n + kLatencyUs);

  // Longer units take longer at the same limit.
  const uint64_t fast = TimedRun(pool, kItems, 2, 5);
  const uint64_t slow = TimedRun(pool, kItems, 2, 25);
  REQUIRE(fast >= 2U * 5000U);
  REQUIRE(slow >= 2U * 25000U);
  REQUIRE(slow > fast + 20000U);

  pool.Shutdown();
}

TEST_CASE("Async units may complete from foreign threads", "[scatter_gather][pool][async]") {
  sg::ThreadPoolConfig cfg;
  cfg.name = "async";
  cfg.worker_num = 2U;
  sg::ThreadPool pool(cfg);
  pool.Start();

  std::mutex mtx;
  std::vector<std::thread> completers;
  auto unit = sg::MakeAsyncUnit<int>(
      [&mtx, &completers](const int& x, const sg::CancelToken&, sg::Completer<int> done) {
        std::lock_guard<std::mutex> lk(mtx);
        completers.emplace_back([x](sg::Completer<int> c) {
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
          (void)c.Succeed(x);
        }, std::move(done));
      });

  sg::RunOptions opts;
  opts.concurrency_limit = 5;
  auto run = sg::ScatterGather(pool, Iota(20), opts, unit, 0, SumInts());
  REQUIRE(run.has_value());
  REQUIRE(run.value().WaitFor(5000000U));
  REQUIRE(run.value().Result().aggregate.value() == 190);

  {
    std::lock_guard<std::mutex> lk(mtx);
    for (auto& t : completers) {
      t.join();
    }
  }
  pool.Shutdown();
}
