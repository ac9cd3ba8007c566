/*
 * 설명: 트래픽 수락 전에 실행해야 하는 초기화 단계를 순서대로 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dependency_initializer_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wallet/db_client.hpp"
#include "wallet/logger.hpp"

namespace wallet {

// 실패는 예외로 알린다. 재시도가 필요하면 단계 자신이 수행한다.
using InitAction = std::function<void()>;

struct InitError {
  std::string step;
  std::string cause;
};

class DependencyInitializer {
 public:
  explicit DependencyInitializer(std::shared_ptr<Logger> logger);

  void AddStep(std::string name, InitAction action);
  std::size_t StepCount() const { return steps_.size(); }

  // 첫 실패에서 멈추고 나머지 단계는 실행하지 않는다.
  std::optional<InitError> Initialize() const;

 private:
  struct Step {
    std::string name;
    InitAction action;
  };

  std::shared_ptr<Logger> logger_;
  std::vector<Step> steps_;
};

InitAction MakeDatabaseStep(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Logger> logger);

}  // namespace wallet
