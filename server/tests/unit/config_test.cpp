#include <cstdlib>

#include <gtest/gtest.h>

#include "arena/config.hpp"

namespace {

const char* kKeys[] = {"SERVER_PORT",          "STORE_BACKEND",       "LOBBY_TIMEOUT_SECONDS", "COUNTDOWN_TICK_MS",
                       "TIMEOUT_SWEEP_SECONDS", "EXECUTION_WORKERS",  "COMPILE_TIMEOUT_MS",    "DEFAULT_TIME_LIMIT_MS",
                       "JWT_SECRET",           "PYTHON_BIN",          "JAVA_BIN",              "WS_QUEUE_LIMIT_MESSAGES",
                       "PROBLEM_CATALOG_PATH", "OUTPUT_LIMIT_BYTES"};

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char* key : kKeys) {
      unsetenv(key);
    }
  }
  void TearDown() override { SetUp(); }
};

}  // namespace

TEST_F(ConfigTest, DefaultsApplyWhenUnset) {
  auto cfg = arena::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.store_backend, "mariadb");
  EXPECT_EQ(cfg.lobby_timeout_seconds, 300u);
  EXPECT_EQ(cfg.countdown_tick_ms, 1000u);
  EXPECT_EQ(cfg.timeout_sweep_seconds, 30u);
  EXPECT_EQ(cfg.execution_workers, 4u);
  EXPECT_EQ(cfg.compile_timeout_ms, 5000u);
  EXPECT_EQ(cfg.default_time_limit_ms, 1000u);
  EXPECT_EQ(cfg.output_limit_bytes, 1048576u);
  EXPECT_EQ(cfg.ws_queue_limit_messages, 8u);
  EXPECT_EQ(cfg.toolchain.python_bin, "python3");
  EXPECT_EQ(cfg.toolchain.java_bin, "java");
  EXPECT_FALSE(cfg.jwt_secret.empty());
  EXPECT_TRUE(cfg.problem_catalog_path.empty());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  setenv("SERVER_PORT", "9001", 1);
  setenv("STORE_BACKEND", "memory", 1);
  setenv("LOBBY_TIMEOUT_SECONDS", "5", 1);
  setenv("EXECUTION_WORKERS", "2", 1);
  setenv("PYTHON_BIN", "/opt/py/bin/python3.12", 1);
  setenv("JWT_SECRET", "s3cret", 1);
  auto cfg = arena::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9001);
  EXPECT_EQ(cfg.store_backend, "memory");
  EXPECT_EQ(cfg.lobby_timeout_seconds, 5u);
  EXPECT_EQ(cfg.execution_workers, 2u);
  EXPECT_EQ(cfg.toolchain.python_bin, "/opt/py/bin/python3.12");
  EXPECT_EQ(cfg.toolchain.gcc_bin, "gcc");
  EXPECT_EQ(cfg.jwt_secret, "s3cret");
}

TEST_F(ConfigTest, MalformedNumberThrows) {
  setenv("SERVER_PORT", "not-a-port", 1);
  EXPECT_THROW(arena::LoadConfigFromEnv(), std::invalid_argument);
}
