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
 * @file aggregator.hpp
 * @brief Serialized folding of Outcomes into a run's aggregate.
 *
 * Two disciplines (FoldMode) give the single-writer guarantee:
 *
 *   kChannel  Producers append to one ordered channel. The producer that finds
 *             the channel idle becomes its consumer and drains it until empty;
 *             everybody else returns immediately. No producer ever waits on a
 *             fold, and exactly one thread consumes at a time.
 *
 *   kMutex    The producer folds its own item under a mutex. Items submitted
 *             by the consumer itself (re-entrant submissions) are queued on a
 *             backlog and drained before the mutex is released.
 *
 * A combiner is any callable
 *   void                  combine(A& acc, const Outcome<V>& outcome);   or
 *   expected<void, Cause> combine(A& acc, const Outcome<V>& outcome);
 * optionally with a `Finalize(A& acc)` member run once on successful
 * completion. Returning an error (or throwing) is an aggregation error.
 */

#ifndef SG_AGGREGATOR_HPP_
#define SG_AGGREGATOR_HPP_

#include "sg/outcome.hpp"
#include "sg/platform.hpp"
#include "sg/vocabulary.hpp"

#include <cstdint>

#include <algorithm>
#include <atomic>
#include <deque>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#if SG_HAS_EXCEPTIONS
#include <exception>
#endif

namespace sg {

enum class FoldMode : uint8_t {
  kChannel = 0,  ///< Single-consumer ordered channel (default)
  kMutex,        ///< Mutual exclusion per fold on the completing thread
};

inline const char* FoldModeName(FoldMode mode) noexcept {
  return mode == FoldMode::kMutex ? "mutex" : "channel";
}

// ============================================================================
// FoldGate<T>
// ============================================================================

/**
 * @brief Serializes calls to a consumer across any number of producer threads.
 *
 * Submit() may be called concurrently and re-entrantly (from inside the
 * consumer). The consumer is never run by two threads at once, and items are
 * consumed in submission order per producer. If the consumer throws, the
 * remaining items are still consumed and the first exception then propagates
 * out of the Submit() call that was draining.
 */
template <typename T>
class FoldGate final {
 public:
  explicit FoldGate(FoldMode mode) noexcept : mode_(mode) {}

  FoldGate(const FoldGate&) = delete;
  FoldGate& operator=(const FoldGate&) = delete;

  template <typename Consume>
  void Submit(T&& item, Consume&& consume) {
    if (mode_ == FoldMode::kChannel) {
      SubmitChannel(std::move(item), consume);
    } else {
      SubmitLocked(std::move(item), consume);
    }
  }

  FoldMode Mode() const noexcept { return mode_; }

  /// @brief Items consumed so far.
  uint64_t Consumed() const noexcept { return consumed_.load(std::memory_order_relaxed); }

 private:
#if SG_HAS_EXCEPTIONS
  using FirstError = std::exception_ptr;
#else
  struct FirstError {};
#endif

  // A throwing consumer does not stop the drain. The first exception is
  // rethrown once the gate is idle again.
  template <typename Consume>
  void ConsumeOne(T&& item, Consume& consume, FirstError& error) {
#if SG_HAS_EXCEPTIONS
    try {
      consume(std::move(item));
    } catch (...) {
      if (!error) {
        error = std::current_exception();
      }
    }
#else
    (void)error;
    consume(std::move(item));
#endif
    consumed_.fetch_add(1U, std::memory_order_relaxed);
  }

  static void RethrowFirst(FirstError& error) {
#if SG_HAS_EXCEPTIONS
    if (error) {
      std::rethrow_exception(error);
    }
#else
    (void)error;
#endif
  }

  template <typename Consume>
  void SubmitChannel(T&& item, Consume& consume) {
    {
      std::lock_guard<std::mutex> lk(queue_mtx_);
      queue_.push_back(std::move(item));
    }
    if (pending_.fetch_add(1U, std::memory_order_acq_rel) != 0U) {
      return;
    }
    FirstError error{};
    do {
      optional<T> next;
      {
        std::lock_guard<std::mutex> lk(queue_mtx_);
        next.emplace(std::move(queue_.front()));
        queue_.pop_front();
      }
      ConsumeOne(std::move(next.value()), consume, error);
    } while (pending_.fetch_sub(1U, std::memory_order_acq_rel) != 1U);
    RethrowFirst(error);
  }

  template <typename Consume>
  void SubmitLocked(T&& item, Consume& consume) {
    if (owner_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
      backlog_.push_back(std::move(item));
      return;
    }
    FirstError error{};
    {
      std::lock_guard<std::mutex> lk(fold_mtx_);
      owner_.store(std::this_thread::get_id(), std::memory_order_release);
      ConsumeOne(std::move(item), consume, error);
      while (!backlog_.empty()) {
        T next(std::move(backlog_.front()));
        backlog_.pop_front();
        ConsumeOne(std::move(next), consume, error);
      }
      owner_.store(std::thread::id(), std::memory_order_release);
    }
    RethrowFirst(error);
  }

  const FoldMode mode_;

  // kChannel
  std::mutex queue_mtx_;
  std::deque<T> queue_;
  std::atomic<uint32_t> pending_{0U};

  // kMutex
  std::mutex fold_mtx_;
  std::atomic<std::thread::id> owner_{};
  std::deque<T> backlog_;  // touched only by the mutex owner

  std::atomic<uint64_t> consumed_{0U};
};

// ============================================================================
// Fold helpers
// ============================================================================

namespace detail {

template <typename C, typename A, typename = void>
struct HasFinalize : std::false_type {};

template <typename C, typename A>
struct HasFinalize<C, A, std::void_t<decltype(std::declval<C&>().Finalize(std::declval<A&>()))>>
    : std::true_type {};

inline Cause AggregationCause(int32_t code, const char* msg, uint32_t item_index) noexcept {
  return Cause::Make(ErrorKind::kAggregation, code, msg, item_index);
}

template <typename A, typename V, typename Combine>
expected<void, Cause> CallCombine(Combine& combine, A& acc, const Outcome<V>& outcome) {
  using R = decltype(combine(acc, outcome));
  if constexpr (std::is_void<R>::value) {
    combine(acc, outcome);
    return expected<void, Cause>::success();
  } else {
    static_assert(std::is_same<typename std::decay<R>::type, expected<void, Cause>>::value,
                  "combine must return void or expected<void, Cause>");
    expected<void, Cause> r = combine(acc, outcome);
    if (!r.has_value()) {
      Cause c = r.get_error();
      c.kind = ErrorKind::kAggregation;
      c.item_index = outcome.Index();
      return expected<void, Cause>::error(c);
    }
    return r;
  }
}

}  // namespace detail

/**
 * @brief Fold one outcome into `acc`. Must be called from the serialized context.
 * @return kAggregation cause if the combiner reported an error or threw.
 */
template <typename A, typename V, typename Combine>
expected<void, Cause> FoldOutcome(Combine& combine, A& acc, const Outcome<V>& outcome) {
#if SG_HAS_EXCEPTIONS
  try {
    return detail::CallCombine(combine, acc, outcome);
  } catch (const std::exception& e) {
    return expected<void, Cause>::error(detail::AggregationCause(-1, e.what(), outcome.Index()));
  } catch (...) {
    return expected<void, Cause>::error(
        detail::AggregationCause(-1, "unknown exception in combine", outcome.Index()));
  }
#else
  return detail::CallCombine(combine, acc, outcome);
#endif
}

/// @brief Run the combiner's Finalize(acc), if it has one.
template <typename A, typename Combine>
expected<void, Cause> FinalizeAggregate(Combine& combine, A& acc) {
  if constexpr (detail::HasFinalize<Combine, A>::value) {
#if SG_HAS_EXCEPTIONS
    try {
      combine.Finalize(acc);
    } catch (const std::exception& e) {
      return expected<void, Cause>::error(detail::AggregationCause(-1, e.what(), kNoItem));
    } catch (...) {
      return expected<void, Cause>::error(
          detail::AggregationCause(-1, "unknown exception in finalize", kNoItem));
    }
#else
    combine.Finalize(acc);
#endif
  } else {
    (void)combine;
    (void)acc;
  }
  return expected<void, Cause>::success();
}

// ============================================================================
// Stock aggregates
// ============================================================================

/// @brief Every success value and every failure cause of a run.
template <typename V>
struct Gathered {
  struct Item {
    uint32_t index;
    V value;
  };

  std::vector<Item> successes;
  std::vector<Cause> failures;
};

/// @brief Appends in arrival order; Finalize() sorts both lists by item index.
template <typename V>
struct GatherCombiner {
  void operator()(Gathered<V>& acc, const Outcome<V>& outcome) const {
    if (outcome.Ok()) {
      acc.successes.push_back(typename Gathered<V>::Item{outcome.Index(), outcome.Value()});
    } else {
      acc.failures.push_back(outcome.GetCause());
    }
  }

  void Finalize(Gathered<V>& acc) const {
    std::sort(acc.successes.begin(), acc.successes.end(),
              [](const typename Gathered<V>::Item& a, const typename Gathered<V>::Item& b) {
                return a.index < b.index;
              });
    std::sort(acc.failures.begin(), acc.failures.end(),
              [](const Cause& a, const Cause& b) { return a.item_index < b.item_index; });
  }
};

/// @brief Running sum of successful values plus success/failure counts.
template <typename T>
struct Tally {
  T sum{};
  uint32_t successes{0U};
  uint32_t failures{0U};
};

template <typename T>
struct TallyCombiner {
  void operator()(Tally<T>& acc, const Outcome<T>& outcome) const {
    if (outcome.Ok()) {
      acc.sum += outcome.Value();
      ++acc.successes;
    } else {
      ++acc.failures;
    }
  }
};

}  // namespace sg

#endif  // SG_AGGREGATOR_HPP_
