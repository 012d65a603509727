/**
 * @file test_engine_config.cpp
 * @brief Tests for LoadEngineConfig().
 */

#include "sg/engine_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>

TEST_CASE("LoadEngineConfig on an empty store yields defaults", "[engine_config]") {
  sg::ConfigStore store;
  auto r = sg::LoadEngineConfig(store);
  REQUIRE(r.has_value());

  const sg::EngineConfig& cfg = r.value();
  REQUIRE(cfg.pool.name == "pool");
  REQUIRE(cfg.pool.worker_num == 1U);
  REQUIRE(cfg.pool.worker_queue_depth == sg::kDefaultWorkerQueueDepth);
  REQUIRE(cfg.run.concurrency_limit == sg::kDefaultConcurrencyLimit);
  REQUIRE(cfg.run.failure_policy == sg::FailurePolicy::kFailFast);
  REQUIRE(cfg.run.fold_mode == sg::FoldMode::kChannel);
  REQUIRE(cfg.run.name == "run");
}

TEST_CASE("LoadEngineConfig reads every section", "[engine_config]") {
  sg::ConfigStore store;
  store.Set("pool", "name", "backend");
  store.Set("pool", "workers", "8");
  store.Set("pool", "queue_depth", "64");
  store.Set("pool", "priority", "-1");
  store.Set("run", "name", "profile-fetch");
  store.Set("run", "concurrency_limit", "16");
  store.Set("run", "failure_policy", "FAIL_SOFT");
  store.Set("run", "fold_mode", "mutex");
  store.Set("log", "level", "warn");

  auto r = sg::LoadEngineConfig(store);
  REQUIRE(r.has_value());
  const sg::EngineConfig& cfg = r.value();
  REQUIRE(cfg.pool.name == "backend");
  REQUIRE(cfg.pool.worker_num == 8U);
  REQUIRE(cfg.pool.worker_queue_depth == 64U);
  REQUIRE(cfg.pool.priority == -1);
  REQUIRE(cfg.run.name == "profile-fetch");
  REQUIRE(cfg.run.concurrency_limit == 16);
  REQUIRE(cfg.run.failure_policy == sg::FailurePolicy::kFailSoft);
  REQUIRE(cfg.run.fold_mode == sg::FoldMode::kMutex);
  REQUIRE(cfg.log_level == sg::log::Level::kWarn);
}

TEST_CASE("LoadEngineConfig rejects malformed values", "[engine_config]") {
  SECTION("unknown failure policy") {
    sg::ConfigStore store;
    store.Set("run", "failure_policy", "best_effort");
    auto r = sg::LoadEngineConfig(store);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == sg::ConfigError::kInvalidValue);
  }

  SECTION("unknown fold mode") {
    sg::ConfigStore store;
    store.Set("run", "fold_mode", "spinlock");
    REQUIRE(sg::LoadEngineConfig(store).get_error() == sg::ConfigError::kInvalidValue);
  }

  SECTION("non-numeric limit") {
    sg::ConfigStore store;
    store.Set("run", "concurrency_limit", "lots");
    REQUIRE(sg::LoadEngineConfig(store).get_error() == sg::ConfigError::kInvalidValue);
  }

  SECTION("zero workers") {
    sg::ConfigStore store;
    store.Set("pool", "workers", "0");
    REQUIRE(sg::LoadEngineConfig(store).get_error() == sg::ConfigError::kInvalidValue);
  }

  SECTION("negative queue depth") {
    sg::ConfigStore store;
    store.Set("pool", "queue_depth", "-5");
    REQUIRE(sg::LoadEngineConfig(store).get_error() == sg::ConfigError::kInvalidValue);
  }

  SECTION("queue depth above the pool cap") {
    sg::ConfigStore store;
    store.Set("pool", "queue_depth", "2147483647");
    REQUIRE(sg::LoadEngineConfig(store).get_error() == sg::ConfigError::kInvalidValue);
  }

  SECTION("more workers than the pool allows") {
    sg::ConfigStore store;
    store.Set("pool", "workers", "100000");
    REQUIRE(sg::LoadEngineConfig(store).get_error() == sg::ConfigError::kInvalidValue);
  }

  SECTION("unknown log level") {
    sg::ConfigStore store;
    store.Set("log", "level", "verbose");
    REQUIRE(sg::LoadEngineConfig(store).get_error() == sg::ConfigError::kInvalidValue);
  }
}

TEST_CASE("LoadEngineConfig accepts the largest pool", "[engine_config]") {
  sg::ConfigStore store;
  store.Set("pool", "workers", "256");
  store.Set("pool", "queue_depth", "65536");
  auto r = sg::LoadEngineConfig(store);
  REQUIRE(r.has_value());
  REQUIRE(r.value().pool.worker_num == sg::kMaxPoolWorkers);
  REQUIRE(r.value().pool.worker_queue_depth == sg::kMaxWorkerQueueDepth);
}

TEST_CASE("LoadEngineConfig passes a non-positive limit through", "[engine_config]") {
  sg::ConfigStore store;
  store.Set("run", "concurrency_limit", "0");
  auto r = sg::LoadEngineConfig(store);
  REQUIRE(r.has_value());
  REQUIRE(r.value().run.concurrency_limit == 0);
}

#ifdef SG_CONFIG_INI_ENABLED
TEST_CASE("LoadEngineConfig from INI text", "[engine_config][ini]") {
  sg::IniConfig ini;
  REQUIRE(ini.LoadText("[pool]\nworkers = 3\n[run]\nfold_mode = channel\nconcurrency_limit = 5\n",
                       sg::ConfigFormat::kIni)
              .has_value());
  auto r = sg::LoadEngineConfig(ini);
  REQUIRE(r.has_value());
  REQUIRE(r.value().pool.worker_num == 3U);
  REQUIRE(r.value().run.concurrency_limit == 5);
}
#endif
