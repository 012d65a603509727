/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file scatter_gather.hpp
 * @brief ScatterGather(): bounded-concurrency fan-out with one folded result.
 *
 * Architecture:
 * @verbatim
 *   caller --ScatterGather()--> RunState --Post(start)--> executor
 *                                  |
 *      +---------------------------+ serialized context (FoldGate)
 *      |  kStart    : admit up to K items, post one task per item
 *      |  kOutcome  : retire item, fold (or abort), admit next item
 *      |  kCancel   : caller abort
 *      v
 *   workers: Invoke(unit, item) -> Completer -> Submit(kOutcome)
 * @endverbatim
 *
 * Every state change of a run (admission, retirement, fold, terminal
 * transition) happens inside the serialized context, so the dispatcher and the
 * aggregate need no locks of their own. Work units run on the executor and
 * only talk back through their Completer.
 *
 * Lifecycle: Idle -> Running on construction; Running -> Completed once every
 * item is folded; Running -> Failed on the first failure (kFailFast), on an
 * aggregation error (any policy) or on RunHandle::Cancel(). Terminal states
 * are final. Outcomes arriving afterwards are discarded and logged.
 *
 * The executor must outlive the run and must never execute a posted task
 * inline from Post().
 *
 * Usage:
 * @code
 *   sg::ThreadPool pool(cfg);
 *   pool.Start();
 *   sg::RunOptions opts;
 *   opts.concurrency_limit = 8;
 *   auto run = sg::ScatterGather(pool, ids, opts,
 *       [](const int& id) { return Fetch(id); },
 *       0, [](int& acc, const sg::Outcome<int>& o) { if (o.Ok()) acc += o.Value(); });
 *   const auto& r = run.value().Result();   // blocks until terminal
 * @endcode
 */

#ifndef SG_SCATTER_GATHER_HPP_
#define SG_SCATTER_GATHER_HPP_

#include "sg/aggregator.hpp"
#include "sg/dispatcher.hpp"
#include "sg/executor.hpp"
#include "sg/invoker.hpp"
#include "sg/log.hpp"
#include "sg/outcome.hpp"
#include "sg/platform.hpp"
#include "sg/vocabulary.hpp"

#include <cstdint>
#include <cstdio>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#if SG_HAS_EXCEPTIONS
#include <exception>
#endif

namespace sg {

// ============================================================================
// Options / Results
// ============================================================================

/// @brief Observes each admission: item index and in-flight count after it.
using AdmitHookFn = void (*)(uint32_t index, uint32_t in_flight, void* ctx);

struct RunOptions {
  int32_t concurrency_limit{kDefaultConcurrencyLimit};
  FailurePolicy failure_policy{FailurePolicy::kFailFast};
  FoldMode fold_mode{FoldMode::kChannel};
  FixedString<31> name{"run"};
  AdmitHookFn on_admit{nullptr};
  void* on_admit_ctx{nullptr};
};

struct RunStats {
  uint32_t total{0U};
  uint32_t admitted{0U};
  uint32_t retired{0U};
  uint32_t succeeded{0U};
  uint32_t failed{0U};
  uint32_t rejected{0U};
  uint32_t peak_in_flight{0U};
  uint32_t concurrency_limit{0U};
};

/**
 * @brief Terminal result of one run.
 *
 * `aggregate` is set iff status == kCompleted; `cause` is meaningful iff
 * status == kFailed.
 */
template <typename A>
struct RunResult {
  RunStatus status{RunStatus::kIdle};
  optional<A> aggregate;
  Cause cause;
  uint64_t elapsed_us{0U};
  RunStats stats;

  bool Completed() const noexcept { return status == RunStatus::kCompleted; }
};

static constexpr size_t kRunCallbackBufferSize = 64U;

namespace detail {

// ============================================================================
// RunSignal<A> - one-shot publication point shared by run and handles
// ============================================================================

template <typename A>
class RunSignal final {
 public:
  using Callback = FixedFunction<void(const RunResult<A>&), kRunCallbackBufferSize>;

  bool Publish(RunResult<A>&& result) {
    Callback cb;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (done_) {
        return false;
      }
      result_.emplace(std::move(result));
      done_ = true;
      cb = std::move(then_);
    }
    cv_.notify_all();
    if (cb) {
      RunCallback(cb);
    }
    return true;
  }

  bool IsDone() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return done_;
  }

  const RunResult<A>& Wait() const {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return done_; });
    return result_.value();
  }

  bool WaitFor(uint64_t timeout_us) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, std::chrono::microseconds(timeout_us), [this] { return done_; });
  }

  /// @return false if a callback is already registered.
  bool Then(Callback&& cb) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (then_ || then_taken_) {
        return false;
      }
      then_taken_ = true;
      if (!done_) {
        then_ = std::move(cb);
        return true;
      }
    }
    cb(result_.value());
    return true;
  }

  void AddDiscarded() noexcept { discarded_.fetch_add(1U, std::memory_order_relaxed); }
  uint32_t Discarded() const noexcept { return discarded_.load(std::memory_order_relaxed); }

 private:
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
  bool done_{false};
  bool then_taken_{false};
  optional<RunResult<A>> result_;
  Callback then_;
  std::atomic<uint32_t> discarded_{0U};

  // The result is already published; a throwing callback cannot change it.
  void RunCallback(Callback& cb) {
#if SG_HAS_EXCEPTIONS
    try {
      cb(result_.value());
    } catch (const std::exception& e) {
      SG_LOG_ERROR("ScatterGather", "completion callback threw: %s", e.what());
    } catch (...) {
      SG_LOG_ERROR("ScatterGather", "completion callback threw a non-standard exception");
    }
#else
    cb(result_.value());
#endif
  }
};

}  // namespace detail

// ============================================================================
// RunHandle<A>
// ============================================================================

/**
 * @brief Caller's view of a run. Copyable; all copies observe the same run.
 *
 * The handle does not keep a finished run's working state alive, only its
 * published result.
 */
template <typename A>
class RunHandle final {
 public:
  using Callback = typename detail::RunSignal<A>::Callback;
  using CancelFn = void (*)(void* run);

  RunHandle(std::shared_ptr<detail::RunSignal<A>> signal, std::weak_ptr<void> run,
            CancelFn cancel) noexcept
      : signal_(std::move(signal)), run_(std::move(run)), cancel_(cancel) {}

  bool IsDone() const { return signal_->IsDone(); }

  void Wait() const { (void)signal_->Wait(); }

  /// @return true if the run reached a terminal state within the timeout.
  bool WaitFor(uint64_t timeout_us) const { return signal_->WaitFor(timeout_us); }

  /// @brief Terminal result; blocks until the run is done.
  const RunResult<A>& Result() const { return signal_->Wait(); }

  /**
   * @brief Register a completion callback (one per run).
   *
   * Runs on the thread that finishes the run, or immediately on the caller's
   * thread if the run is already done. The callback must not block and must
   * not throw: an exception on the finishing thread is logged and dropped,
   * one on the caller's thread propagates out of Then(). The callback is
   * stored in the shared result, so it must not capture a RunHandle of the
   * same run; that forms a cycle and the run's result is never freed.
   */
  bool Then(Callback&& cb) { return signal_->Then(std::move(cb)); }

  /**
   * @brief Abort the run: it ends Failed with a kCancelled cause and its
   *        cancellation token is set for in-flight units.
   * @return false if the run had already finished.
   */
  bool Cancel() {
    if (signal_->IsDone()) {
      return false;
    }
    std::shared_ptr<void> run = run_.lock();
    if (run == nullptr) {
      return false;
    }
    cancel_(run.get());
    return true;
  }

  /// @brief Outcomes that arrived after the terminal transition.
  uint32_t Discarded() const noexcept { return signal_->Discarded(); }

 private:
  std::shared_ptr<detail::RunSignal<A>> signal_;
  std::weak_ptr<void> run_;
  CancelFn cancel_;
};

namespace detail {

// ============================================================================
// RunState
// ============================================================================

enum class RunEventKind : uint8_t {
  kStart = 0,
  kStartRejected,
  kOutcome,
  kCancel,
};

template <typename Executor, typename In, typename Unit, typename A, typename Combine>
class RunState final
    : public std::enable_shared_from_this<RunState<Executor, In, Unit, A, Combine>> {
 public:
  using V = typename UnitTraits<Unit, In>::ValueType;

  struct Event {
    RunEventKind kind;
    optional<Outcome<V>> outcome;
  };

  RunState(Executor& executor, std::vector<In>&& items, const RunOptions& options, Unit&& unit,
           A&& zero, Combine&& combine)
      : executor_(executor),
        items_(std::move(items)),
        options_(options),
        unit_(std::move(unit)),
        combine_(std::move(combine)),
        acc_(std::move(zero)),
        dispatcher_(static_cast<uint32_t>(items_.size()),
                    static_cast<uint32_t>(options.concurrency_limit)),
        gate_(options.fold_mode),
        token_(cancel_.Token()),
        signal_(std::make_shared<RunSignal<A>>()),
        start_us_(SteadyNowUs()) {}

  // Reached without a terminal state only when the executor dropped the
  // run's pending tasks. Waiters still get a result.
  ~RunState() {
    if (signal_->IsDone()) {
      return;
    }
    RunResult<A> result;
    result.status = RunStatus::kFailed;
    result.cause = Cause::Make(ErrorKind::kAbandoned, 0, "run released before finishing");
    result.elapsed_us = ElapsedSinceUs(start_us_);
    result.stats = Stats();
    SG_LOG_WARN("ScatterGather", "[%s] abandoned with %u/%u retired", options_.name.c_str(),
                dispatcher_.Retired(), dispatcher_.Total());
    (void)signal_->Publish(std::move(result));
  }

  RunState(const RunState&) = delete;
  RunState& operator=(const RunState&) = delete;

  RunHandle<A> Handle() {
    return RunHandle<A>(signal_, std::weak_ptr<void>(this->shared_from_this()), &RunState::OnCancel);
  }

  /// @brief Idle -> Running. Empty input completes on the calling thread.
  void Start() {
    SG_LOG_INFO("ScatterGather", "[%s] start: %u items, limit %u, %s, fold=%s", options_.name.c_str(),
                dispatcher_.Total(), dispatcher_.Limit(),
                options_.failure_policy == FailurePolicy::kFailFast ? "fail_fast" : "fail_soft",
                FoldModeName(options_.fold_mode));
    if (dispatcher_.Total() == 0U) {
      Submit(Event{RunEventKind::kStart, optional<Outcome<V>>()});
      return;
    }
    std::shared_ptr<RunState> self = this->shared_from_this();
    if (!executor_.Post([self]() { self->Submit(Event{RunEventKind::kStart, optional<Outcome<V>>()}); })) {
      Submit(Event{RunEventKind::kStartRejected, optional<Outcome<V>>()});
    }
  }

 private:
  static void Deliver(void* ctx, Outcome<V>&& outcome) {
    static_cast<RunState*>(ctx)->Submit(Event{RunEventKind::kOutcome, optional<Outcome<V>>(std::move(outcome))});
  }

  static void OnCancel(void* ctx) {
    static_cast<RunState*>(ctx)->Submit(Event{RunEventKind::kCancel, optional<Outcome<V>>()});
  }

  void Submit(Event&& ev) {
    gate_.Submit(std::move(ev), [this](Event&& e) { Consume(std::move(e)); });
  }

  // Worker side: one unit for one item.
  void Execute(uint32_t index) {
    Completer<V> done(this->shared_from_this(), &RunState::Deliver, index);
    Invoke<V>(unit_, items_[index], token_, std::move(done));
  }

  // ---- everything below runs inside the serialized context ----

  void Consume(Event&& ev) {
#if SG_HAS_EXCEPTIONS
    try {
      Dispatch(std::move(ev));
    } catch (const std::exception& e) {
      Abort(e.what());
    } catch (...) {
      Abort("non-standard exception");
    }
#else
    Dispatch(std::move(ev));
#endif
  }

  void Abort(const char* what) {
    SG_LOG_ERROR("ScatterGather", "[%s] exception in serialized context: %s", options_.name.c_str(),
                 what);
    if (!terminal_) {
      Finish(RunStatus::kFailed, Cause::Make(ErrorKind::kAggregation, -1, what));
    }
  }

  void Dispatch(Event&& ev) {
    switch (ev.kind) {
      case RunEventKind::kStart:
        if (dispatcher_.AllRetired()) {
          Finish(RunStatus::kCompleted, Cause());
        } else {
          Admit();
        }
        break;
      case RunEventKind::kStartRejected:
        Finish(RunStatus::kFailed, Cause::Make(ErrorKind::kRejected, 0, "executor refused run start"));
        break;
      case RunEventKind::kOutcome:
        OnOutcome(std::move(ev.outcome.value()));
        break;
      case RunEventKind::kCancel:
        if (!terminal_) {
          Finish(RunStatus::kFailed, Cause::Make(ErrorKind::kCancelled, 0, "cancelled by caller"));
        }
        break;
      default:
        break;
    }
  }

  void Admit() {
    optional<uint32_t> next = dispatcher_.TryAdmit();
    while (next.has_value()) {
      const uint32_t index = next.value();
      if (!CallAdmitHook(index)) {
        return;
      }
      std::shared_ptr<RunState> self = this->shared_from_this();
      if (!executor_.Post([self, index]() { self->Execute(index); })) {
        ++rejected_;
        SG_LOG_WARN("ScatterGather", "[%s] executor rejected item %u", options_.name.c_str(), index);
        Submit(Event{RunEventKind::kOutcome,
                     optional<Outcome<V>>(Outcome<V>::Failure(
                         index, Cause::Make(ErrorKind::kRejected, 0, "executor rejected work unit")))});
      }
      next = dispatcher_.TryAdmit();
    }
  }

  /// @return false if the hook threw; the run has then failed on `index`.
  bool CallAdmitHook(uint32_t index) {
    if (options_.on_admit == nullptr) {
      return true;
    }
#if SG_HAS_EXCEPTIONS
    try {
      options_.on_admit(index, dispatcher_.InFlight(), options_.on_admit_ctx);
      return true;
    } catch (const std::exception& e) {
      FailAdmission(index, e.what());
    } catch (...) {
      FailAdmission(index, "non-standard exception");
    }
    return false;
#else
    options_.on_admit(index, dispatcher_.InFlight(), options_.on_admit_ctx);
    return true;
#endif
  }

  void FailAdmission(uint32_t index, const char* what) {
    char msg[kCauseMessageLen + 1U];
    (void)std::snprintf(msg, sizeof(msg), "admission hook threw: %s", what);
    SG_LOG_WARN("ScatterGather", "[%s] item %u: %s", options_.name.c_str(), index, msg);
    Finish(RunStatus::kFailed, Cause::Make(ErrorKind::kWorkUnit, -1, msg, index));
  }

  void OnOutcome(Outcome<V>&& outcome) {
    if (terminal_) {
      signal_->AddDiscarded();
      SG_LOG_DEBUG("ScatterGather", "[%s] item %u arrived after %s, discarded", options_.name.c_str(),
                   outcome.Index(), RunStatusName(status_));
      return;
    }
    if (!dispatcher_.Retire(outcome.Index())) {
      SG_LOG_WARN("ScatterGather", "[%s] duplicate or unknown outcome for item %u ignored",
                  options_.name.c_str(), outcome.Index());
      return;
    }
    if (outcome.Ok()) {
      ++succeeded_;
    } else {
      ++failed_;
      if (options_.failure_policy == FailurePolicy::kFailFast) {
        Finish(RunStatus::kFailed, outcome.GetCause());
        return;
      }
    }

    expected<void, Cause> folded = FoldOutcome(combine_, acc_, outcome);
    if (!folded.has_value()) {
      Finish(RunStatus::kFailed, folded.get_error());
      return;
    }

    if (dispatcher_.AllRetired()) {
      Finish(RunStatus::kCompleted, Cause());
      return;
    }
    Admit();
  }

  void Finish(RunStatus status, const Cause& cause) {
    terminal_ = true;
    dispatcher_.Close();

    RunResult<A> result;
    result.cause = cause;
    if (status == RunStatus::kCompleted) {
      expected<void, Cause> fin = FinalizeAggregate(combine_, acc_);
      if (fin.has_value()) {
        result.aggregate.emplace(std::move(acc_));
      } else {
        status = RunStatus::kFailed;
        result.cause = fin.get_error();
      }
    }
    if (status == RunStatus::kFailed) {
      cancel_.Cancel();
    }
    status_ = status;
    result.status = status;
    result.elapsed_us = ElapsedSinceUs(start_us_);
    result.stats = Stats();

    if (status == RunStatus::kCompleted) {
      SG_LOG_INFO("ScatterGather", "[%s] completed: %u ok, %u failed, peak %u/%u, %llu us",
                  options_.name.c_str(), succeeded_, failed_, dispatcher_.PeakInFlight(),
                  dispatcher_.Limit(), static_cast<unsigned long long>(result.elapsed_us));
    } else {
      SG_LOG_INFO("ScatterGather", "[%s] failed (%s, item %d): %s; %u/%u retired, %llu us",
                  options_.name.c_str(), ErrorKindName(result.cause.kind),
                  result.cause.item_index == kNoItem ? -1 : static_cast<int>(result.cause.item_index),
                  result.cause.message.c_str(), dispatcher_.Retired(), dispatcher_.Total(),
                  static_cast<unsigned long long>(result.elapsed_us));
    }
    (void)signal_->Publish(std::move(result));
  }

  RunStats Stats() const noexcept {
    RunStats s;
    s.total = dispatcher_.Total();
    s.admitted = dispatcher_.Admitted();
    s.retired = dispatcher_.Retired();
    s.succeeded = succeeded_;
    s.failed = failed_;
    s.rejected = rejected_;
    s.peak_in_flight = dispatcher_.PeakInFlight();
    s.concurrency_limit = dispatcher_.Limit();
    return s;
  }

  Executor& executor_;
  const std::vector<In> items_;
  const RunOptions options_;
  const Unit unit_;
  Combine combine_;
  A acc_;

  BoundedDispatcher dispatcher_;
  FoldGate<Event> gate_;
  CancelSource cancel_;
  const CancelToken token_;
  std::shared_ptr<RunSignal<A>> signal_;
  const uint64_t start_us_;

  // serialized context only
  bool terminal_{false};
  RunStatus status_{RunStatus::kRunning};
  uint32_t succeeded_{0U};
  uint32_t failed_{0U};
  uint32_t rejected_{0U};
};

}  // namespace detail

// ============================================================================
// Entry points
// ============================================================================

/**
 * @brief Start a run over `items`.
 *
 * Returns without waiting for any unit. Fails synchronously, before any unit
 * starts, when options.concurrency_limit <= 0.
 *
 * @param executor Runs the units and the serialized context; must outlive the run.
 * @param items    Input sequence, admitted in order.
 * @param options  Limit, failure policy, fold discipline, name and admission hook.
 * @param unit     Blocking callable or AsyncUnit; see invoker.hpp.
 * @param zero     Initial aggregate.
 * @param combine  Folds one Outcome into the aggregate; see aggregator.hpp.
 */
template <typename Executor, typename In, typename Unit, typename A, typename Combine>
expected<RunHandle<A>, EngineError> ScatterGather(Executor& executor, std::vector<In> items,
                                                  const RunOptions& options, Unit unit, A zero,
                                                  Combine combine) {
  expected<void, EngineError> valid = ValidateDispatch(items.size(), options.concurrency_limit);
  if (!valid.has_value()) {
    SG_LOG_ERROR("ScatterGather", "[%s] rejected: concurrency_limit=%d, items=%u",
                 options.name.c_str(), static_cast<int>(options.concurrency_limit),
                 static_cast<unsigned>(items.size()));
    return expected<RunHandle<A>, EngineError>::error(valid.get_error());
  }

  using State = detail::RunState<Executor, In, Unit, A, Combine>;
  std::shared_ptr<State> run = std::make_shared<State>(executor, std::move(items), options,
                                                       std::move(unit), std::move(zero),
                                                       std::move(combine));
  RunHandle<A> handle = run->Handle();
  run->Start();
  return expected<RunHandle<A>, EngineError>::success(std::move(handle));
}

/// @brief ScatterGather() into a Gathered<V> of every success and failure.
template <typename Executor, typename In, typename Unit>
expected<RunHandle<Gathered<typename UnitTraits<Unit, In>::ValueType>>, EngineError> Gather(
    Executor& executor, std::vector<In> items, const RunOptions& options, Unit unit) {
  using V = typename UnitTraits<Unit, In>::ValueType;
  return ScatterGather(executor, std::move(items), options, std::move(unit), Gathered<V>(),
                       GatherCombiner<V>());
}

}  // namespace sg

#endif  // SG_SCATTER_GATHER_HPP_
