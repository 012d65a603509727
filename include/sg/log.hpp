/**
 * @file log.hpp
 * @brief Lightweight synchronous logging with category tags and level filtering.
 *
 * Each call formats one complete line and writes it to stderr with a single
 * fprintf, so lines from concurrent threads never interleave mid-line.
 *
 * Two filters apply:
 *   - compile time: SG_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL) removes calls
 *     below the floor entirely;
 *   - run time: SetLevel() drops calls below the current threshold.
 *
 * Usage:
 * @code
 *   sg::log::Init();
 *   SG_LOG_INFO("Pool", "started %u workers", n);
 *   sg::log::Shutdown();
 * @endcode
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef SG_LOG_HPP_
#define SG_LOG_HPP_

#include "sg/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#if defined(SG_PLATFORM_LINUX) || defined(SG_PLATFORM_MACOS)
#include <time.h>
#endif

// ============================================================================
// Compile-Time Configuration
// ============================================================================

#ifndef SG_LOG_MIN_LEVEL
#ifdef NDEBUG
#define SG_LOG_MIN_LEVEL 1
#else
#define SG_LOG_MIN_LEVEL 0
#endif
#endif

namespace sg {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format the current wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(SG_PLATFORM_LINUX) || defined(SG_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, static_cast<long>(ts.tv_nsec / 1000000L));
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                        tm_local->tm_year + 1900, tm_local->tm_mon + 1,
                        tm_local->tm_mday, tm_local->tm_hour, tm_local->tm_min,
                        tm_local->tm_sec);
  } else {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
  }
#endif
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Mark the logger initialized. Idempotent.
 *
 * Logging works without Init(); it only flushes stderr and records state so
 * applications can pair it with Shutdown().
 */
inline void Init() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Format and write one log line (va_list variant).
 *
 * FATAL flushes and aborts after writing.
 */
inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif

  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
  if (level == Level::kFatal) {
    std::abort();
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace sg

// ============================================================================
// Macros
// ============================================================================

#define SG_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                     \
    if (SG_LOG_MIN_LEVEL <= 0) {                                           \
      ::sg::log::LogWrite(::sg::log::Level::kDebug, cat, __FILE__,         \
                          __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                      \
  } while (0)

#define SG_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                     \
    if (SG_LOG_MIN_LEVEL <= 1) {                                           \
      ::sg::log::LogWrite(::sg::log::Level::kInfo, cat, __FILE__,          \
                          __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                      \
  } while (0)

#define SG_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                     \
    if (SG_LOG_MIN_LEVEL <= 2) {                                           \
      ::sg::log::LogWrite(::sg::log::Level::kWarn, cat, __FILE__,          \
                          __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                      \
  } while (0)

#define SG_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                     \
    if (SG_LOG_MIN_LEVEL <= 3) {                                           \
      ::sg::log::LogWrite(::sg::log::Level::kError, cat, __FILE__,         \
                          __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                      \
  } while (0)

#define SG_LOG_FATAL(cat, fmt, ...)                                        \
  do {                                                                     \
    ::sg::log::LogWrite(::sg::log::Level::kFatal, cat, __FILE__, __LINE__, \
                        fmt, ##__VA_ARGS__);                               \
  } while (0)

#endif  // SG_LOG_HPP_
