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
 * @file outcome.hpp
 * @brief Per-item Outcome, failure Cause and run-level enums.
 *
 * An Outcome<V> is what one work unit produces for one input item:
 * Success(value) or Failure(cause), tagged with the item index.
 */

#ifndef SG_OUTCOME_HPP_
#define SG_OUTCOME_HPP_

#include "sg/platform.hpp"
#include "sg/vocabulary.hpp"

#include <cstdint>
#include <utility>

namespace sg {

// ============================================================================
// Error codes
// ============================================================================

/// @brief Errors returned synchronously by ScatterGather() before a run starts.
enum class EngineError : uint8_t {
  kInvalidConcurrencyLimit = 0,  ///< concurrency_limit <= 0
  kTooManyItems,                 ///< Item count does not fit the index space
};

/// @brief Classification carried by every failure Cause.
enum class ErrorKind : uint8_t {
  kNone = 0,
  kWorkUnit,     ///< The per-item operation reported or threw an error
  kAggregation,  ///< The combine operation failed; aggregate integrity unknown
  kCancelled,    ///< Cancelled by the caller or by a fail-fast abort
  kRejected,     ///< The executor refused to accept the work unit
  kAbandoned,    ///< Completer destroyed without signalling an outcome
};

inline const char* ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kWorkUnit:
      return "work_unit";
    case ErrorKind::kAggregation:
      return "aggregation";
    case ErrorKind::kCancelled:
      return "cancelled";
    case ErrorKind::kRejected:
      return "rejected";
    case ErrorKind::kAbandoned:
      return "abandoned";
    default:
      return "unknown";
  }
}

static constexpr uint32_t kNoItem = UINT32_MAX;
static constexpr uint32_t kCauseMessageLen = 95U;

// ============================================================================
// Cause
// ============================================================================

/**
 * @brief Why an item (or a whole run) failed.
 *
 * Trivially copyable so it can cross threads by value.
 */
struct Cause {
  ErrorKind kind{ErrorKind::kNone};
  int32_t code{0};
  uint32_t item_index{kNoItem};
  FixedString<kCauseMessageLen> message;

  static Cause Make(ErrorKind kind, int32_t code, const char* msg,
                    uint32_t item_index = kNoItem) noexcept {
    Cause c;
    c.kind = kind;
    c.code = code;
    c.item_index = item_index;
    c.message.assign(TruncateToCapacity, msg);
    return c;
  }

  /// @brief Convenience for work units reporting their own error.
  static Cause WorkUnit(int32_t code, const char* msg) noexcept {
    return Make(ErrorKind::kWorkUnit, code, msg);
  }
};

// ============================================================================
// Outcome<V>
// ============================================================================

template <typename V>
class Outcome final {
 public:
  using ValueType = V;

  static Outcome Success(uint32_t index, V value) {
    return Outcome(index, expected<V, Cause>::success(std::move(value)));
  }

  static Outcome Failure(uint32_t index, Cause cause) {
    cause.item_index = index;
    return Outcome(index, expected<V, Cause>::error(cause));
  }

  /// @brief Build from a unit's result, stamping the item index on failures.
  static Outcome From(uint32_t index, expected<V, Cause>&& result) {
    if (result.has_value()) {
      return Success(index, std::move(result).value());
    }
    return Failure(index, result.get_error());
  }

  uint32_t Index() const noexcept { return index_; }
  bool Ok() const noexcept { return result_.has_value(); }

  const V& Value() const noexcept { return result_.value(); }
  V& Value() noexcept { return result_.value(); }
  const Cause& GetCause() const noexcept { return result_.get_error(); }

  const expected<V, Cause>& Result() const noexcept { return result_; }

 private:
  Outcome(uint32_t index, expected<V, Cause>&& result)
      : index_(index), result_(std::move(result)) {}

  uint32_t index_;
  expected<V, Cause> result_;
};

// ============================================================================
// Run-level enums
// ============================================================================

enum class FailurePolicy : uint8_t {
  kFailFast = 0,  ///< First failure aborts the run
  kFailSoft,      ///< Failures are folded; run completes when all items are accounted for
};

enum class RunStatus : uint8_t {
  kIdle = 0,
  kRunning,
  kCompleted,
  kFailed,
};

inline const char* RunStatusName(RunStatus status) noexcept {
  switch (status) {
    case RunStatus::kIdle:
      return "idle";
    case RunStatus::kRunning:
      return "running";
    case RunStatus::kCompleted:
      return "completed";
    case RunStatus::kFailed:
      return "failed";
    default:
      return "unknown";
  }
}

}  // namespace sg

#endif  // SG_OUTCOME_HPP_
