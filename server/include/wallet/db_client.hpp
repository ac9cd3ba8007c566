/*
 * 설명: MariaDB 연결과 일시 오류 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/db_client_test.cpp, server/tests/it/database_step_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

#include "wallet/logger.hpp"

namespace wallet {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

// 연결이 끊기거나 서버에 닿지 못한 경우만 다시 시도할 가치가 있다.
bool IsTransientConnectionError(unsigned int code);

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config, std::shared_ptr<Logger> logger = nullptr);

  // 일시 오류면 최대 3회까지 다시 연결해 work를 실행한다.
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  // SELECT NOW() 결과(서버 시각)를 반환한다.
  std::string Ping() const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  const DbConfig& GetConfig() const { return config_; }

 private:
  MYSQL* Connect() const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  std::shared_ptr<Logger> logger_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace wallet
