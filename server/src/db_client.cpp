/*
 * 설명: MariaDB 연결, 연결 확인 쿼리, 재시도 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/db_client_test.cpp, server/tests/it/database_step_it_test.cpp
 */
#include "wallet/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace wallet {
namespace {
constexpr std::size_t kMaxAttempts = 3;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config, std::shared_ptr<Logger> logger)
    : config_(config), logger_(std::move(logger)) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB client initialization failed", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  try {
    if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                            config_.database.c_str(), config_.port, nullptr, 0)) {
      RaiseError(conn, "connect failed");
    }
  } catch (...) {
    mysql_close(conn);
    throw;
  }
  return conn;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    MYSQL* conn = nullptr;
    try {
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("injected transient error", CR_SERVER_LOST, true);
      }
      conn = Connect();
      work(conn);
      mysql_close(conn);
      return;
    } catch (const DbException& ex) {
      if (conn) {
        mysql_close(conn);
      }
      if (ex.retryable && attempt < kMaxAttempts) {
        if (logger_) {
          logger_->Warn("Database operation failed, retrying",
                        {{"error", ex.what()}, {"code", ex.code}, {"attempt", attempt}});
        }
        Backoff(attempt);
        continue;
      }
      throw;
    } catch (...) {
      if (conn) {
        mysql_close(conn);
      }
      throw;
    }
  }
}

std::string MariaDbClient::Ping() const {
  std::string server_time;
  WithConnectionRetry([this, &server_time](MYSQL* conn) {
    if (mysql_query(conn, "SELECT NOW()") != 0) {
      RaiseError(conn, "connection check failed");
    }
    MYSQL_RES* result = mysql_store_result(conn);
    if (!result) {
      RaiseError(conn, "connection check returned no result");
    }
    MYSQL_ROW row = mysql_fetch_row(result);
    if (row && row[0]) {
      server_time = row[0];
    }
    mysql_free_result(result);
  });
  return server_time;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsTransientConnectionError(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool IsTransientConnectionError(unsigned int code) {
  return code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR || code == CR_CONN_HOST_ERROR ||
         code == CR_CONNECTION_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace wallet
