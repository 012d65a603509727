/**
 * @file dispatcher.hpp
 * @brief Credit-based admission over a finite, ordered input sequence.
 *
 * BoundedDispatcher hands out item indices in sequence order while fewer than
 * `limit` items are in flight. Every Retire() returns one credit, so the next
 * pending item is admitted as soon as any in-flight item finishes; there are no
 * fixed batches. The dispatcher holds no lock: it lives inside the Run's
 * serialized context and is only touched from there.
 *
 * Usage:
 * @code
 *   sg::BoundedDispatcher d(items.size(), 4);
 *   while (auto idx = d.TryAdmit()) { Start(*idx); }
 *   ...
 *   d.Retire(done_idx);            // frees one credit
 * @endcode
 */

#ifndef SG_DISPATCHER_HPP_
#define SG_DISPATCHER_HPP_

#include "sg/outcome.hpp"
#include "sg/platform.hpp"
#include "sg/vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <vector>

namespace sg {

/// @brief Default bound on in-flight work units per run.
static constexpr int32_t kDefaultConcurrencyLimit = 4;

/// @brief Check a caller-supplied limit and item count before a run starts.
inline expected<void, EngineError> ValidateDispatch(size_t item_count,
                                                    int32_t concurrency_limit) noexcept {
  if (concurrency_limit <= 0) {
    return expected<void, EngineError>::error(EngineError::kInvalidConcurrencyLimit);
  }
  if (item_count >= static_cast<size_t>(kNoItem)) {
    return expected<void, EngineError>::error(EngineError::kTooManyItems);
  }
  return expected<void, EngineError>::success();
}

class BoundedDispatcher final {
 public:
  BoundedDispatcher(uint32_t total, uint32_t limit)
      : total_(total), limit_(limit), retired_flags_(total, false) {}

  BoundedDispatcher(const BoundedDispatcher&) = delete;
  BoundedDispatcher& operator=(const BoundedDispatcher&) = delete;

  /**
   * @brief Take the next item if a credit is free.
   * @return Index of the admitted item, or empty when the limit is reached,
   *         the input is exhausted or the dispatcher is closed.
   */
  optional<uint32_t> TryAdmit() noexcept {
    if (closed_ || next_ >= total_ || in_flight_ >= limit_) {
      return optional<uint32_t>();
    }
    uint32_t idx = next_++;
    ++in_flight_;
    if (in_flight_ > peak_in_flight_) {
      peak_in_flight_ = in_flight_;
    }
    return optional<uint32_t>(idx);
  }

  /**
   * @brief Return the credit held by `index`.
   * @return false if `index` was never admitted or is already retired.
   */
  bool Retire(uint32_t index) noexcept {
    if (index >= next_ || retired_flags_[index]) {
      return false;
    }
    retired_flags_[index] = true;
    --in_flight_;
    ++retired_;
    return true;
  }

  /// @brief Stop admitting. In-flight items may still retire.
  void Close() noexcept { closed_ = true; }

  bool Closed() const noexcept { return closed_; }
  bool AllRetired() const noexcept { return retired_ == total_; }

  uint32_t InFlight() const noexcept { return in_flight_; }
  uint32_t Admitted() const noexcept { return next_; }
  uint32_t Retired() const noexcept { return retired_; }
  uint32_t PeakInFlight() const noexcept { return peak_in_flight_; }
  uint32_t Limit() const noexcept { return limit_; }
  uint32_t Total() const noexcept { return total_; }

 private:
  const uint32_t total_;
  const uint32_t limit_;
  uint32_t next_{0U};
  uint32_t in_flight_{0U};
  uint32_t retired_{0U};
  uint32_t peak_in_flight_{0U};
  bool closed_{false};
  std::vector<bool> retired_flags_;
};

}  // namespace sg

#endif  // SG_DISPATCHER_HPP_
