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
 * @file invoker.hpp
 * @brief WorkUnit invocation: cancellation tokens, one-shot completers and
 *        the Invoke() boundary that turns any unit into exactly one Outcome.
 *
 * A work unit is one of two shapes, both handled by Invoke():
 *
 *   Blocking: any callable
 *       R unit(const In& item, const CancelToken& token);   or
 *       R unit(const In& item);
 *     where R is V or expected<V, Cause>. The call may block the worker
 *     thread it runs on; its return value is the outcome.
 *
 *   Asynchronous: MakeAsyncUnit<V>(fn) with
 *       void fn(const In& item, const CancelToken& token, Completer<V> done);
 *     fn returns quickly and signals `done` later, from any thread.
 *
 * Guarantees at the Invoke() boundary:
 *   - exactly one Outcome is delivered per invocation (a second signal is
 *     refused; a Completer dropped unsignalled delivers kAbandoned);
 *   - an exception escaping the unit becomes Failure(kWorkUnit) and never
 *     unwinds further (when built with exceptions);
 *   - a unit whose token is already cancelled is not called at all.
 *
 * Units are invoked through a const reference from several workers at once
 * and must be safe to call concurrently.
 */

#ifndef SG_INVOKER_HPP_
#define SG_INVOKER_HPP_

#include "sg/log.hpp"
#include "sg/outcome.hpp"
#include "sg/platform.hpp"
#include "sg/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <type_traits>
#include <utility>

#if SG_HAS_EXCEPTIONS
#include <exception>
#endif

namespace sg {

// ============================================================================
// Cancellation
// ============================================================================

class CancelSource;

/**
 * @brief Read side of a cancellation flag.
 *
 * A default-constructed token is never cancelled. Cancellation is advisory:
 * units that cannot stop early simply run to completion.
 */
class CancelToken final {
 public:
  CancelToken() noexcept = default;

  bool IsCancelled() const noexcept {
    return flag_ != nullptr && flag_->load(std::memory_order_acquire);
  }

 private:
  friend class CancelSource;
  explicit CancelToken(std::shared_ptr<const std::atomic<bool>> flag) noexcept
      : flag_(std::move(flag)) {}

  std::shared_ptr<const std::atomic<bool>> flag_;
};

class CancelSource final {
 public:
  CancelSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  /// @return true for the call that actually set the flag.
  bool Cancel() noexcept { return !flag_->exchange(true, std::memory_order_acq_rel); }

  bool IsCancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

  CancelToken Token() const noexcept { return CancelToken(flag_); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// ============================================================================
// Completer<V>
// ============================================================================

/**
 * @brief One-shot capability to signal the outcome of one item.
 *
 * Move-only. The first Succeed()/Fail()/Complete() delivers the outcome and
 * drops the reference to the run; later calls return false. Destroying a
 * completer that never signalled delivers Failure(kAbandoned).
 */
template <typename V>
class Completer final {
 public:
  /// @brief Receives the outcome; ctx is the owner pointer given at construction.
  using DeliverFn = void (*)(void* ctx, Outcome<V>&& outcome);

  Completer() noexcept = default;

  Completer(std::shared_ptr<void> owner, DeliverFn deliver, uint32_t index) noexcept
      : owner_(std::move(owner)), deliver_(deliver), index_(index) {}

  Completer(Completer&& other) noexcept
      : owner_(std::move(other.owner_)), deliver_(other.deliver_), index_(other.index_) {
    other.deliver_ = nullptr;
  }

  Completer& operator=(Completer&& other) noexcept {
    if (this != &other) {
      Abandon();
      owner_ = std::move(other.owner_);
      deliver_ = other.deliver_;
      index_ = other.index_;
      other.deliver_ = nullptr;
    }
    return *this;
  }

  Completer(const Completer&) = delete;
  Completer& operator=(const Completer&) = delete;

  ~Completer() { Abandon(); }

  bool Succeed(V value) { return Deliver(Outcome<V>::Success(index_, std::move(value))); }

  bool Fail(const Cause& cause) { return Deliver(Outcome<V>::Failure(index_, cause)); }

  bool Complete(expected<V, Cause>&& result) {
    return Deliver(Outcome<V>::From(index_, std::move(result)));
  }

  /// @brief True until an outcome has been signalled (or the completer moved from).
  bool Pending() const noexcept { return deliver_ != nullptr; }

  uint32_t Index() const noexcept { return index_; }

 private:
  bool Deliver(Outcome<V>&& outcome) {
    if (deliver_ == nullptr) {
      SG_LOG_WARN("Invoker", "item %u: outcome already signalled, extra signal ignored", index_);
      return false;
    }
    DeliverFn fn = deliver_;
    deliver_ = nullptr;
    std::shared_ptr<void> owner = std::move(owner_);
    fn(owner.get(), std::move(outcome));
    return true;
  }

  void Abandon() noexcept {
    if (deliver_ != nullptr) {
      (void)Fail(Cause::Make(ErrorKind::kAbandoned, 0, "completer dropped without an outcome"));
    }
  }

  std::shared_ptr<void> owner_;
  DeliverFn deliver_{nullptr};
  uint32_t index_{kNoItem};
};

// ============================================================================
// Unit shapes
// ============================================================================

/// @brief Tag wrapper marking a callback-style (non-blocking) unit.
template <typename V, typename Fn>
struct AsyncUnit {
  Fn fn;
};

template <typename V, typename Fn>
AsyncUnit<V, typename std::decay<Fn>::type> MakeAsyncUnit(Fn&& fn) {
  return AsyncUnit<V, typename std::decay<Fn>::type>{std::forward<Fn>(fn)};
}

namespace detail {

template <typename Unit, typename In, typename = void>
struct BlockingUnitResult {
  using type = typename std::invoke_result<const Unit&, const In&>::type;
  static constexpr bool kTakesToken = false;
};

template <typename Unit, typename In>
struct BlockingUnitResult<
    Unit, In,
    typename std::enable_if<std::is_invocable<const Unit&, const In&, const CancelToken&>::value>::type> {
  using type = typename std::invoke_result<const Unit&, const In&, const CancelToken&>::type;
  static constexpr bool kTakesToken = true;
};

template <typename R, bool = is_expected<R>::value>
struct ResultValue {
  using type = R;
};

template <typename R>
struct ResultValue<R, true> {
  using type = typename R::value_type;
};

}  // namespace detail

/**
 * @brief Compile-time description of a unit: its value type and shape.
 */
template <typename Unit, typename In>
struct UnitTraits {
  using Result = typename std::decay<typename detail::BlockingUnitResult<Unit, In>::type>::type;
  using ValueType = typename detail::ResultValue<Result>::type;
  static constexpr bool kAsync = false;
  static constexpr bool kTakesToken = detail::BlockingUnitResult<Unit, In>::kTakesToken;
  static constexpr bool kReturnsExpected = is_expected<Result>::value;

  static_assert(!std::is_void<ValueType>::value, "Work unit must produce a value");
};

template <typename V, typename Fn, typename In>
struct UnitTraits<AsyncUnit<V, Fn>, In> {
  using ValueType = V;
  static constexpr bool kAsync = true;
  static constexpr bool kTakesToken = true;
  static constexpr bool kReturnsExpected = false;
};

// ============================================================================
// Invoke
// ============================================================================

namespace detail {

template <typename V, typename Unit, typename In>
void InvokeUnit(const Unit& unit, const In& item, const CancelToken& token, Completer<V>& done) {
  using Traits = UnitTraits<Unit, In>;
  if constexpr (Traits::kTakesToken) {
    if constexpr (Traits::kReturnsExpected) {
      done.Complete(unit(item, token));
    } else {
      done.Succeed(unit(item, token));
    }
  } else {
    if constexpr (Traits::kReturnsExpected) {
      done.Complete(unit(item));
    } else {
      done.Succeed(unit(item));
    }
  }
}

template <typename V, typename Fn, typename In>
void InvokeUnit(const AsyncUnit<V, Fn>& unit, const In& item, const CancelToken& token,
                Completer<V>& done) {
  unit.fn(item, token, std::move(done));
}

}  // namespace detail

/**
 * @brief Run one unit for one item and deliver its outcome through `done`.
 *
 * Never lets an error escape: every path ends in exactly one delivery.
 */
template <typename V, typename Unit, typename In>
void Invoke(const Unit& unit, const In& item, const CancelToken& token, Completer<V>&& done) {
  Completer<V> local(std::move(done));
  if (token.IsCancelled()) {
    local.Fail(Cause::Make(ErrorKind::kCancelled, 0, "cancelled before start"));
    return;
  }
#if SG_HAS_EXCEPTIONS
  try {
    detail::InvokeUnit<V>(unit, item, token, local);
  } catch (const std::exception& e) {
    if (local.Pending()) {
      local.Fail(Cause::Make(ErrorKind::kWorkUnit, -1, e.what()));
    } else {
      SG_LOG_WARN("Invoker", "item %u: exception after the outcome was delivered: %s",
                  local.Index(), e.what());
    }
  } catch (...) {
    if (local.Pending()) {
      local.Fail(Cause::Make(ErrorKind::kWorkUnit, -1, "unknown exception"));
    } else {
      SG_LOG_WARN("Invoker", "item %u: exception after the outcome was delivered", local.Index());
    }
  }
#else
  detail::InvokeUnit<V>(unit, item, token, local);
#endif
}

}  // namespace sg

#endif  // SG_INVOKER_HPP_
