/*
 * 설명: 초기화 단계 실행과 데이터베이스 연결 확인 단계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dependency_initializer_test.cpp, server/tests/it/database_step_it_test.cpp
 */
#include "wallet/dependency_initializer.hpp"

#include <exception>

namespace wallet {

DependencyInitializer::DependencyInitializer(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

void DependencyInitializer::AddStep(std::string name, InitAction action) {
  steps_.push_back(Step{std::move(name), std::move(action)});
}

std::optional<InitError> DependencyInitializer::Initialize() const {
  for (const auto& step : steps_) {
    logger_->Debug("Initializing dependency", {{"step", step.name}});
    std::string cause;
    try {
      step.action();
      continue;
    } catch (const std::exception& ex) {
      cause = ex.what();
    } catch (...) {
      cause = "unknown error";
    }
    logger_->Error("Failed to initialize services", {{"step", step.name}, {"error", cause}});
    return InitError{step.name, cause};
  }
  logger_->Info("All services initialized successfully");
  return std::nullopt;
}

InitAction MakeDatabaseStep(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Logger> logger) {
  return [db_client, logger]() {
    auto server_time = db_client->Ping();
    logger->Info("Database connection established successfully", {{"serverTime", server_time}});
  };
}

}  // namespace wallet
