/**
 * @file engine_config.hpp
 * @brief Typed engine settings read from a ConfigStore.
 *
 * Recognized entries (all optional, defaults in brackets):
 * @verbatim
 *   [pool] name [pool]  workers [1]  queue_depth [1024]  priority [0]
 *   [run]  name [run]   concurrency_limit [4]
 *          failure_policy  fail_fast | fail_soft        [fail_fast]
 *          fold_mode       channel | mutex              [channel]
 *   [log]  level           debug | info | warn | error | off
 * @endverbatim
 *
 * Malformed numbers and unknown spellings are errors (kInvalidValue), never
 * silently replaced by defaults. A concurrency_limit <= 0 is accepted here and
 * rejected by ScatterGather() itself.
 */

#ifndef SG_ENGINE_CONFIG_HPP_
#define SG_ENGINE_CONFIG_HPP_

#include "sg/config.hpp"
#include "sg/log.hpp"
#include "sg/scatter_gather.hpp"
#include "sg/thread_pool.hpp"
#include "sg/vocabulary.hpp"

#include <cstdint>

namespace sg {

struct EngineConfig {
  ThreadPoolConfig pool;
  RunOptions run;
  log::Level log_level{log::GetLevel()};
};

namespace detail {

inline bool ParseFailurePolicy(const char* s, FailurePolicy& out) noexcept {
  if (EqualsNoCase(s, "fail_fast")) {
    out = FailurePolicy::kFailFast;
  } else if (EqualsNoCase(s, "fail_soft")) {
    out = FailurePolicy::kFailSoft;
  } else {
    return false;
  }
  return true;
}

inline bool ParseFoldMode(const char* s, FoldMode& out) noexcept {
  if (EqualsNoCase(s, "channel")) {
    out = FoldMode::kChannel;
  } else if (EqualsNoCase(s, "mutex")) {
    out = FoldMode::kMutex;
  } else {
    return false;
  }
  return true;
}

inline bool ParseLogLevel(const char* s, log::Level& out) noexcept {
  static const struct {
    const char* name;
    log::Level level;
  } kLevels[] = {
      {"debug", log::Level::kDebug}, {"info", log::Level::kInfo},   {"warn", log::Level::kWarn},
      {"error", log::Level::kError}, {"fatal", log::Level::kFatal}, {"off", log::Level::kOff},
  };
  for (const auto& l : kLevels) {
    if (EqualsNoCase(s, l.name)) {
      out = l.level;
      return true;
    }
  }
  return false;
}

/// @brief Read an int entry if present; false if present but malformed.
inline bool ReadInt(const ConfigStore& store, const char* section, const char* key,
                    int32_t& out) {
  if (!store.HasKey(section, key)) {
    return true;
  }
  optional<int32_t> v = store.FindInt(section, key);
  if (!v.has_value()) {
    SG_LOG_WARN("Config", "[%s] %s: '%s' is not an integer", section, key,
                store.GetString(section, key));
    return false;
  }
  out = v.value();
  return true;
}

inline bool ReadCount(const ConfigStore& store, const char* section, const char* key,
                      uint32_t& out) {
  int32_t v = static_cast<int32_t>(out);
  if (!ReadInt(store, section, key, v)) {
    return false;
  }
  if (v < 0) {
    SG_LOG_WARN("Config", "[%s] %s must not be negative", section, key);
    return false;
  }
  out = static_cast<uint32_t>(v);
  return true;
}

}  // namespace detail

/**
 * @brief Build an EngineConfig from `store`, starting from defaults.
 * @return kInvalidValue on the first malformed entry.
 */
inline expected<EngineConfig, ConfigError> LoadEngineConfig(const ConfigStore& store) {
  using Result = expected<EngineConfig, ConfigError>;
  EngineConfig cfg;

  if (store.HasKey("pool", "name")) {
    cfg.pool.name.assign(TruncateToCapacity, store.GetString("pool", "name"));
  }
  if (!detail::ReadCount(store, "pool", "workers", cfg.pool.worker_num) ||
      !detail::ReadCount(store, "pool", "queue_depth", cfg.pool.worker_queue_depth) ||
      !detail::ReadInt(store, "pool", "priority", cfg.pool.priority)) {
    return Result::error(ConfigError::kInvalidValue);
  }
  if (cfg.pool.worker_num == 0U || cfg.pool.worker_queue_depth == 0U) {
    SG_LOG_WARN("Config", "[pool] workers and queue_depth must be positive");
    return Result::error(ConfigError::kInvalidValue);
  }
  if (cfg.pool.worker_num > kMaxPoolWorkers ||
      cfg.pool.worker_queue_depth > kMaxWorkerQueueDepth) {
    SG_LOG_WARN("Config", "[pool] workers above %u or queue_depth above %u", kMaxPoolWorkers,
                kMaxWorkerQueueDepth);
    return Result::error(ConfigError::kInvalidValue);
  }

  if (store.HasKey("run", "name")) {
    cfg.run.name.assign(TruncateToCapacity, store.GetString("run", "name"));
  }
  if (!detail::ReadInt(store, "run", "concurrency_limit", cfg.run.concurrency_limit)) {
    return Result::error(ConfigError::kInvalidValue);
  }
  if (store.HasKey("run", "failure_policy") &&
      !detail::ParseFailurePolicy(store.GetString("run", "failure_policy"),
                                  cfg.run.failure_policy)) {
    SG_LOG_WARN("Config", "[run] failure_policy: unknown value '%s'",
                store.GetString("run", "failure_policy"));
    return Result::error(ConfigError::kInvalidValue);
  }
  if (store.HasKey("run", "fold_mode") &&
      !detail::ParseFoldMode(store.GetString("run", "fold_mode"), cfg.run.fold_mode)) {
    SG_LOG_WARN("Config", "[run] fold_mode: unknown value '%s'", store.GetString("run", "fold_mode"));
    return Result::error(ConfigError::kInvalidValue);
  }

  if (store.HasKey("log", "level") &&
      !detail::ParseLogLevel(store.GetString("log", "level"), cfg.log_level)) {
    SG_LOG_WARN("Config", "[log] level: unknown value '%s'", store.GetString("log", "level"));
    return Result::error(ConfigError::kInvalidValue);
  }

  return Result::success(cfg);
}

}  // namespace sg

#endif  // SG_ENGINE_CONFIG_HPP_
