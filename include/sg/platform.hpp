/**
 * @file platform.hpp
 * @brief Build environment detection, monotonic time and the debug assertion.
 *
 * Everything here is header-only and free of engine types so that every other
 * header can include it first.
 */

#ifndef SG_PLATFORM_HPP_
#define SG_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>
#include <thread>

#if defined(__linux__)
#define SG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define SG_PLATFORM_MACOS 1
#endif

// Work units and combiners may throw; the engine catches only when the
// translation unit is built with exceptions.
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define SG_HAS_EXCEPTIONS 1
#else
#define SG_HAS_EXCEPTIONS 0
#endif

namespace sg {

/// Alignment for counters written by different threads.
static constexpr size_t kCacheLineSize = 64U;

// ============================================================================
// Time
// ============================================================================

inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

inline uint64_t SteadyNowUs() noexcept { return SteadyNowNs() / 1000U; }

/// @brief Microseconds since `start_us` (a SteadyNowUs() stamp), never negative.
inline uint64_t ElapsedSinceUs(uint64_t start_us) noexcept {
  const uint64_t now = SteadyNowUs();
  return now > start_us ? now - start_us : 0U;
}

// ============================================================================
// Spin hint
// ============================================================================

/// @brief Pause instruction for busy-wait loops; falls back to a yield.
inline void CpuRelax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
  __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
  asm volatile("yield" ::: "memory");
#else
  std::this_thread::yield();
#endif
}

// ============================================================================
// SG_ASSERT
// ============================================================================

namespace detail {

[[noreturn]] inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "SG_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

}  // namespace sg

// Checks caller contract violations (value() on an error, empty callable).
// Compiled out with NDEBUG.
#ifdef NDEBUG
#define SG_ASSERT(cond) ((void)0)
#else
#define SG_ASSERT(cond) ((cond) ? ((void)0) : ::sg::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // SG_PLATFORM_HPP_
