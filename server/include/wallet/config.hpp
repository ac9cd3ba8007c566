/*
 * 설명: 서비스 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace wallet {

struct AppConfig {
  std::string service_name{"wallet-service"};
  std::string service_version{"1.0.0"};
  std::string host{"localhost"};
  unsigned short port{3002};
  std::string node_env{"development"};
  std::string default_wallet_provider{"providus"};
  std::string log_level{"info"};
  // 에러 레벨 파일은 같은 디렉터리의 <stem>-error<ext>
  std::string log_file{"logs/wallet-service.log"};
  std::vector<std::string> cors_origins;
  // 최대 24시간
  std::size_t shutdown_timeout_ms{10000};
  std::size_t worker_threads{1};
  std::size_t body_limit_bytes{10 * 1024 * 1024};
  std::size_t request_timeout_seconds{30};
  std::string db_host{"localhost"};
  unsigned short db_port{3306};
  std::string db_user{"wallet"};
  std::string db_password{"wallet_pass"};
  std::string db_name{"wallet_db"};

  bool IsProduction() const { return node_env == "production"; }
  bool IsDevelopment() const { return node_env == "development"; }
};

std::vector<std::string> CorsOriginsFor(const std::string& node_env);

// 값이 숫자가 아니거나 범위를 벗어나면 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace wallet
