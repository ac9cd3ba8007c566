#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "wallet/config.hpp"

namespace {

const char* kVars[] = {"PORT", "HOST", "NODE_ENV", "DEFAULT_WALLET_PROVIDER", "SERVICE_VERSION", "LOG_LEVEL",
                       "LOG_FILE", "SHUTDOWN_TIMEOUT_MS", "WORKER_THREADS", "BODY_LIMIT_BYTES",
                       "REQUEST_TIMEOUT_SECONDS",
                       "DB_HOST", "DB_PORT", "DB_USER", "DB_PASSWORD", "DB_NAME"};

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { Clear(); }
  void TearDown() override { Clear(); }

  static void Clear() {
    for (const char* var : kVars) {
      unsetenv(var);
    }
  }
};

}  // namespace

TEST_F(ConfigTest, DefaultsMatchServiceContract) {
  auto cfg = wallet::LoadConfigFromEnv();
  EXPECT_EQ(cfg.service_name, "wallet-service");
  EXPECT_EQ(cfg.service_version, "1.0.0");
  EXPECT_EQ(cfg.port, 3002);
  EXPECT_EQ(cfg.host, "localhost");
  EXPECT_EQ(cfg.node_env, "development");
  EXPECT_EQ(cfg.default_wallet_provider, "providus");
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.log_file, "logs/wallet-service.log");
  EXPECT_EQ(cfg.shutdown_timeout_ms, 10000u);
  EXPECT_EQ(cfg.worker_threads, 1u);
  EXPECT_EQ(cfg.body_limit_bytes, 10u * 1024u * 1024u);
  EXPECT_EQ(cfg.db_port, 3306);
  ASSERT_EQ(cfg.cors_origins.size(), 3u);
  EXPECT_EQ(cfg.cors_origins[0], "http://localhost:3000");
  EXPECT_TRUE(cfg.IsDevelopment());
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
  setenv("PORT", "8088", 1);
  setenv("HOST", "0.0.0.0", 1);
  setenv("NODE_ENV", "production", 1);
  setenv("DEFAULT_WALLET_PROVIDER", "paystack", 1);
  setenv("SHUTDOWN_TIMEOUT_MS", "2500", 1);
  setenv("WORKER_THREADS", "4", 1);
  setenv("DB_NAME", "wallets", 1);

  auto cfg = wallet::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8088);
  EXPECT_EQ(cfg.host, "0.0.0.0");
  EXPECT_TRUE(cfg.IsProduction());
  EXPECT_EQ(cfg.default_wallet_provider, "paystack");
  EXPECT_EQ(cfg.shutdown_timeout_ms, 2500u);
  EXPECT_EQ(cfg.worker_threads, 4u);
  EXPECT_EQ(cfg.db_name, "wallets");
  ASSERT_EQ(cfg.cors_origins.size(), 1u);
  EXPECT_EQ(cfg.cors_origins[0], "https://yourplatform.com");
}

TEST_F(ConfigTest, EmptyValueFallsBackToDefault) {
  setenv("PORT", "", 1);
  EXPECT_EQ(wallet::LoadConfigFromEnv().port, 3002);
}

TEST_F(ConfigTest, RejectsMalformedNumbers) {
  setenv("PORT", "abc", 1);
  EXPECT_THROW(wallet::LoadConfigFromEnv(), std::invalid_argument);
  setenv("PORT", "70000", 1);
  EXPECT_THROW(wallet::LoadConfigFromEnv(), std::invalid_argument);
  setenv("PORT", "-1", 1);
  EXPECT_THROW(wallet::LoadConfigFromEnv(), std::invalid_argument);
  setenv("PORT", "80x", 1);
  EXPECT_THROW(wallet::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsZeroWorkerThreads) {
  setenv("WORKER_THREADS", "0", 1);
  EXPECT_THROW(wallet::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, TimeoutsAreCappedAtOneDay) {
  setenv("SHUTDOWN_TIMEOUT_MS", "86400000", 1);
  setenv("REQUEST_TIMEOUT_SECONDS", "86400", 1);
  auto cfg = wallet::LoadConfigFromEnv();
  EXPECT_EQ(cfg.shutdown_timeout_ms, 86400000u);
  EXPECT_EQ(cfg.request_timeout_seconds, 86400u);

  setenv("SHUTDOWN_TIMEOUT_MS", "86400001", 1);
  EXPECT_THROW(wallet::LoadConfigFromEnv(), std::invalid_argument);
  setenv("SHUTDOWN_TIMEOUT_MS", "18446744073709551615", 1);
  EXPECT_THROW(wallet::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("SHUTDOWN_TIMEOUT_MS");

  setenv("REQUEST_TIMEOUT_SECONDS", "86401", 1);
  EXPECT_THROW(wallet::LoadConfigFromEnv(), std::invalid_argument);
}
