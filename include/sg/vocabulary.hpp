/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, FixedString, FixedFunction.
 *
 * Value-semantic building blocks used across the library in place of
 * exceptions and heap-allocating type erasure:
 *   - expected<V, E> : value or error code (void specialization included)
 *   - optional<T>    : maybe-value
 *   - FixedString<N> : bounded, null-terminated inline string
 *   - FixedFunction  : move-only callable with inline storage (no heap)
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef SG_VOCABULARY_HPP_
#define SG_VOCABULARY_HPP_

#include "sg/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace sg {

// ============================================================================
// Error enums shared by several modules
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

template <typename V, typename E>
class expected final {
 public:
  using value_type = V;
  using error_type = E;

  static expected success(const V& value) {
    expected r;
    ::new (static_cast<void*>(&r.value_)) V(value);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& value) {
    expected r;
    ::new (static_cast<void*>(&r.value_)) V(std::move(value));
    r.has_value_ = true;
    return r;
  }

  static expected error(const E& err) {
    expected r;
    ::new (static_cast<void*>(&r.error_)) E(err);
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
    } else {
      ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
      } else {
        ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    SG_ASSERT(has_value_);
    return value_;
  }

  const V& value() const& noexcept {
    SG_ASSERT(has_value_);
    return value_;
  }

  V&& value() && noexcept {
    SG_ASSERT(has_value_);
    return std::move(value_);
  }

  const E& get_error() const noexcept {
    SG_ASSERT(!has_value_);
    return error_;
  }

  template <typename U>
  V value_or(U&& default_value) const& {
    return has_value_ ? value_ : static_cast<V>(std::forward<U>(default_value));
  }

 private:
  expected() noexcept : dummy_(0), has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    } else {
      error_.~E();
    }
  }

  union {
    uint8_t dummy_;
    V value_;
    E error_;
  };
  bool has_value_;
};

template <typename E>
class expected<void, E> final {
 public:
  using value_type = void;
  using error_type = E;

  static expected success() noexcept {
    expected r;
    r.has_value_ = true;
    return r;
  }

  static expected error(const E& err) noexcept {
    expected r;
    r.error_ = err;
    r.has_value_ = false;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    SG_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() noexcept : error_{}, has_value_(false) {}

  E error_;
  bool has_value_;
};

template <typename T>
struct is_expected : std::false_type {};

template <typename V, typename E>
struct is_expected<expected<V, E>> : std::true_type {};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : dummy_(0), has_value_(false) {}

  optional(const T& value) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&value_)) T(value);
  }

  optional(T&& value) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&value_)) T(std::move(value));
  }

  optional(const optional& other) : dummy_(0), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) T(other.value_);
    }
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : dummy_(0), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(other.value_);
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  template <typename... Args>
  T& emplace(Args&&... args) {
    reset();
    ::new (static_cast<void*>(&value_)) T(std::forward<Args>(args)...);
    has_value_ = true;
    return value_;
  }

  void reset() noexcept {
    if (has_value_) {
      value_.~T();
      has_value_ = false;
    }
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & noexcept {
    SG_ASSERT(has_value_);
    return value_;
  }

  const T& value() const& noexcept {
    SG_ASSERT(has_value_);
    return value_;
  }

  T* operator->() noexcept { return &value(); }
  const T* operator->() const noexcept { return &value(); }
  T& operator*() & noexcept { return value(); }
  const T& operator*() const& noexcept { return value(); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value_ ? value_ : static_cast<T>(std::forward<U>(default_value));
  }

 private:
  union {
    uint8_t dummy_;
    T value_;
  };
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

struct TruncateToCapacity_t {
  explicit TruncateToCapacity_t() = default;
};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with inline storage of Capacity characters.
 *
 * Construction from a literal is checked at compile time; runtime strings go
 * through the TruncateToCapacity overloads.
 */
template <uint32_t Capacity>
class FixedString final {
  static_assert(Capacity > 0U, "FixedString capacity must be > 0");

 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept : size_(0U) {  // NOLINT(google-explicit-constructor)
    static_assert(N - 1U <= Capacity, "String literal exceeds FixedString capacity");
    Copy(str, N - 1U);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept : size_(0U) {
    Copy(str, len < Capacity ? len : Capacity);
  }

  template <uint32_t N>
  FixedString& operator=(const char (&str)[N]) noexcept {
    static_assert(N - 1U <= Capacity, "String literal exceeds FixedString capacity");
    Copy(str, N - 1U);
    return *this;
  }

  FixedString& assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return *this;
    }
    uint32_t len = 0U;
    while (len < Capacity && str[len] != '\0') {
      ++len;
    }
    Copy(str, len);
    return *this;
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  bool operator==(const char* other) const noexcept {
    return (other != nullptr) && (std::strcmp(buf_, other) == 0);
  }

  bool operator!=(const char* other) const noexcept { return !(*this == other); }

  template <uint32_t N>
  bool operator==(const FixedString<N>& other) const noexcept {
    return (size_ == other.size()) && (std::memcmp(buf_, other.c_str(), size_) == 0);
  }

  template <uint32_t N>
  bool operator!=(const FixedString<N>& other) const noexcept {
    return !(*this == other);
  }

 private:
  void Copy(const char* src, uint32_t len) noexcept {
    std::memcpy(buf_, src, len);
    buf_[len] = '\0';
    size_ = len;
  }

  char buf_[Capacity + 1U];
  uint32_t size_;
};

// ============================================================================
// FixedFunction<Signature, BufferSize>
// ============================================================================

static constexpr size_t kDefaultFixedFunctionSize = 4U * sizeof(void*);

template <typename Signature, size_t BufferSize = kDefaultFixedFunctionSize>
class FixedFunction;

/**
 * @brief Move-only type-erased callable stored inline.
 *
 * The callable must fit in BufferSize bytes; oversize captures are rejected
 * at compile time instead of falling back to the heap.
 */
template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> final {
 public:
  FixedFunction() noexcept = default;
  FixedFunction(std::nullptr_t) noexcept {}  // NOLINT(google-explicit-constructor)

  template <typename F,
            typename D = typename std::decay<F>::type,
            typename = typename std::enable_if<!std::is_same<D, FixedFunction>::value>::type>
  FixedFunction(F&& fn) noexcept {  // NOLINT(google-explicit-constructor)
    static_assert(sizeof(D) <= BufferSize, "Callable too large for FixedFunction buffer");
    static_assert(alignof(D) <= alignof(std::max_align_t), "Callable over-aligned for FixedFunction");
    static_assert(std::is_nothrow_move_constructible<D>::value,
                  "FixedFunction callable must be nothrow move constructible");
    ::new (static_cast<void*>(storage_)) D(std::forward<F>(fn));
    invoke_ = &InvokeImpl<D>;
    manage_ = &ManageImpl<D>;
  }

  FixedFunction(FixedFunction&& other) noexcept { MoveFrom(other); }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      Reset();
      MoveFrom(other);
    }
    return *this;
  }

  FixedFunction& operator=(std::nullptr_t) noexcept {
    Reset();
    return *this;
  }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  ~FixedFunction() { Reset(); }

  Ret operator()(Args... args) {
    SG_ASSERT(invoke_ != nullptr);
    return invoke_(static_cast<void*>(storage_), std::forward<Args>(args)...);
  }

  explicit operator bool() const noexcept { return invoke_ != nullptr; }

 private:
  enum class Op : uint8_t { kMove, kDestroy };

  using InvokeFn = Ret (*)(void*, Args&&...);
  using ManageFn = void (*)(Op, void* dst, void* src);

  template <typename D>
  static Ret InvokeImpl(void* obj, Args&&... args) {
    if constexpr (std::is_void<Ret>::value) {
      (*static_cast<D*>(obj))(std::forward<Args>(args)...);
    } else {
      return (*static_cast<D*>(obj))(std::forward<Args>(args)...);
    }
  }

  template <typename D>
  static void ManageImpl(Op op, void* dst, void* src) noexcept {
    D* s = static_cast<D*>(src);
    if (op == Op::kMove) {
      ::new (dst) D(std::move(*s));
    }
    s->~D();
  }

  void MoveFrom(FixedFunction& other) noexcept {
    if (other.manage_ != nullptr) {
      other.manage_(Op::kMove, static_cast<void*>(storage_), static_cast<void*>(other.storage_));
      invoke_ = other.invoke_;
      manage_ = other.manage_;
      other.invoke_ = nullptr;
      other.manage_ = nullptr;
    }
  }

  void Reset() noexcept {
    if (manage_ != nullptr) {
      manage_(Op::kDestroy, nullptr, static_cast<void*>(storage_));
      invoke_ = nullptr;
      manage_ = nullptr;
    }
  }

  alignas(std::max_align_t) unsigned char storage_[BufferSize];
  InvokeFn invoke_{nullptr};
  ManageFn manage_{nullptr};
};

}  // namespace sg

#endif  // SG_VOCABULARY_HPP_
