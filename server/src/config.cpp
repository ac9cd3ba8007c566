/*
 * 설명: 환경변수에서 서비스 설정을 한 번 읽어 AppConfig로 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "wallet/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace wallet {
namespace {
constexpr std::size_t kMaxShutdownTimeoutMs = 24 * 60 * 60 * 1000;
constexpr std::size_t kMaxRequestTimeoutSeconds = 24 * 60 * 60;

std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return (val && *val) ? std::string{val} : std::string{def};
}

std::size_t ParseUnsigned(const char* key, const std::string& value, std::size_t max) {
  std::size_t idx = 0;
  unsigned long long parsed = 0;
  try {
    if (!value.empty() && value.front() == '-') {
      throw std::invalid_argument("negative");
    }
    parsed = std::stoull(value, &idx);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string(key) + " must be a non-negative integer, got '" + value + "'");
  }
  if (idx != value.size() || parsed > max) {
    throw std::invalid_argument(std::string(key) + " is out of range: '" + value + "'");
  }
  return static_cast<std::size_t>(parsed);
}

unsigned short ParsePort(const char* key, const std::string& value) {
  return static_cast<unsigned short>(ParseUnsigned(key, value, std::numeric_limits<unsigned short>::max()));
}
}  // namespace

std::vector<std::string> CorsOriginsFor(const std::string& node_env) {
  if (node_env == "production") {
    return {"https://yourplatform.com"};
  }
  return {"http://localhost:3000", "http://localhost:3001", "http://localhost:8000"};
}

AppConfig LoadConfigFromEnv() {
  const auto max_size = std::numeric_limits<std::size_t>::max();

  AppConfig cfg;
  cfg.service_version = GetEnv("SERVICE_VERSION", "1.0.0");
  cfg.host = GetEnv("HOST", "localhost");
  cfg.port = ParsePort("PORT", GetEnv("PORT", "3002"));
  cfg.node_env = GetEnv("NODE_ENV", "development");
  cfg.default_wallet_provider = GetEnv("DEFAULT_WALLET_PROVIDER", "providus");
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.log_file = GetEnv("LOG_FILE", "logs/wallet-service.log");
  cfg.cors_origins = CorsOriginsFor(cfg.node_env);
  cfg.shutdown_timeout_ms =
      ParseUnsigned("SHUTDOWN_TIMEOUT_MS", GetEnv("SHUTDOWN_TIMEOUT_MS", "10000"), kMaxShutdownTimeoutMs);
  cfg.worker_threads = ParseUnsigned("WORKER_THREADS", GetEnv("WORKER_THREADS", "1"), 256);
  if (cfg.worker_threads == 0) {
    throw std::invalid_argument("WORKER_THREADS must be at least 1");
  }
  cfg.body_limit_bytes = ParseUnsigned("BODY_LIMIT_BYTES", GetEnv("BODY_LIMIT_BYTES", "10485760"), max_size);
  cfg.request_timeout_seconds =
      ParseUnsigned("REQUEST_TIMEOUT_SECONDS", GetEnv("REQUEST_TIMEOUT_SECONDS", "30"), kMaxRequestTimeoutSeconds);
  cfg.db_host = GetEnv("DB_HOST", "localhost");
  cfg.db_port = ParsePort("DB_PORT", GetEnv("DB_PORT", "3306"));
  cfg.db_user = GetEnv("DB_USER", "wallet");
  cfg.db_password = GetEnv("DB_PASSWORD", "wallet_pass");
  cfg.db_name = GetEnv("DB_NAME", "wallet_db");
  return cfg;
}

}  // namespace wallet
