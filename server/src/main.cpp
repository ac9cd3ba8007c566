/*
 * 설명: 서비스 진입점. 환경설정을 로드하고 의존성 초기화 단계를 구성해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/startup_test.cpp
 */
#include <cstdlib>
#include <exception>
#include <memory>
#include <stdexcept>

#include "wallet/app.hpp"
#include "wallet/config.hpp"
#include "wallet/db_client.hpp"
#include "wallet/dependency_initializer.hpp"
#include "wallet/logger.hpp"
#include "wallet/router.hpp"

int main() {
  using namespace wallet;
  auto logger = std::make_shared<Logger>("wallet-service");

  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    logger->Error("Failed to start server", {{"error", ex.what()}});
    return kExitFailure;
  }
  logger->SetLevel(ParseLogLevel(config.log_level));
  try {
    logger->OpenLogFiles(config.log_file);
  } catch (const std::runtime_error& ex) {
    logger->Warn("File logging disabled", {{"error", ex.what()}, {"logFile", config.log_file}});
  }

  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  auto db_client = std::make_shared<MariaDbClient>(db_config, logger);

  DependencyInitializer initializer(logger);
  initializer.AddStep("database", MakeDatabaseStep(db_client, logger));

  // 지갑 도메인 라우트는 이 라우터에 등록되어 /api/v1 아래로 마운트된다.
  auto api_routes = std::make_shared<Router>();

  try {
    ServiceApp app(config, logger, std::move(initializer), api_routes);
    return app.Run();
  } catch (const std::exception& ex) {
    logger->Error("Failed to start server", {{"error", ex.what()}});
    return kExitFailure;
  }
}
