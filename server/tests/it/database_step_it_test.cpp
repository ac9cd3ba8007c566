#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "wallet/db_client.hpp"
#include "wallet/dependency_initializer.hpp"

namespace {

wallet::DbConfig TestDbConfig() {
  wallet::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "wallet";
  cfg.password = pass ? pass : "wallet_pass";
  cfg.database = name ? name : "wallet_db";
  return cfg;
}

bool DatabaseReachable(const wallet::DbConfig& cfg) {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    return false;
  }
  unsigned int timeout = 2;
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
  bool ok = mysql_real_connect(conn, cfg.host.c_str(), cfg.user.c_str(), cfg.password.c_str(), cfg.database.c_str(),
                               cfg.port, nullptr, 0) != nullptr;
  mysql_close(conn);
  return ok;
}

class DatabaseStepItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestDbConfig();
    if (!DatabaseReachable(config_)) {
      GTEST_SKIP() << "MariaDB is not reachable at " << config_.host << ":" << config_.port;
    }
    logger_ = std::make_shared<wallet::Logger>("wallet-service");
    logger_->SetSink([this](const wallet::LogRecord& record, const nlohmann::json&) {
      messages_.push_back(record.message);
    });
  }

  wallet::DbConfig config_;
  std::shared_ptr<wallet::Logger> logger_;
  std::vector<std::string> messages_;
};

}  // namespace

TEST_F(DatabaseStepItTest, PingReturnsServerTime) {
  wallet::MariaDbClient client(config_, logger_);
  auto server_time = client.Ping();
  EXPECT_FALSE(server_time.empty());
}

TEST_F(DatabaseStepItTest, DatabaseStepLogsEstablishedConnection) {
  auto client = std::make_shared<wallet::MariaDbClient>(config_, logger_);
  wallet::DependencyInitializer initializer(logger_);
  initializer.AddStep("database", wallet::MakeDatabaseStep(client, logger_));

  EXPECT_FALSE(initializer.Initialize().has_value());
  ASSERT_EQ(messages_.size(), 2u);
  EXPECT_EQ(messages_[0], "Database connection established successfully");
  EXPECT_EQ(messages_[1], "All services initialized successfully");
}

TEST_F(DatabaseStepItTest, TransientErrorsAreRetriedInsideTheAction) {
  wallet::MariaDbClient client(config_, logger_);
  std::size_t injected = 0;
  client.SetTransientInjector([&injected](std::size_t attempt) {
    if (attempt < 3) {
      ++injected;
      return true;
    }
    return false;
  });

  EXPECT_FALSE(client.Ping().empty());
  EXPECT_EQ(injected, 2u);
  EXPECT_EQ(messages_.size(), 2u);
}

TEST_F(DatabaseStepItTest, PersistentTransientErrorFailsAfterThreeAttempts) {
  wallet::MariaDbClient client(config_, logger_);
  std::size_t attempts = 0;
  client.SetTransientInjector([&attempts](std::size_t) {
    ++attempts;
    return true;
  });

  EXPECT_THROW(client.Ping(), wallet::DbException);
  EXPECT_EQ(attempts, 3u);
}

TEST_F(DatabaseStepItTest, WrongCredentialsAreNotRetried) {
  auto cfg = config_;
  cfg.password = "definitely-wrong";
  wallet::MariaDbClient client(cfg, logger_);
  try {
    client.Ping();
    FAIL() << "expected DbException";
  } catch (const wallet::DbException& ex) {
    EXPECT_FALSE(ex.retryable);
  }
  EXPECT_TRUE(messages_.empty());
}
