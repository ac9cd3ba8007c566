/*
 * 설명: 수락된 연결을 추적해 종료 시 드레인 완료 여부를 판단하고 잔여 연결을 강제로 닫는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_tracker_test.cpp, server/tests/e2e/graceful_shutdown_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace wallet {

class TrackedConnection {
 public:
  virtual ~TrackedConnection() = default;
  // 연결 소유 executor에서 소켓을 닫도록 예약한다.
  virtual void ForceClose() = 0;
};

class ConnectionTracker {
 public:
  using Id = std::uint64_t;

  Id Register(const std::weak_ptr<TrackedConnection>& connection);
  void Unregister(Id id);

  std::size_t ActiveCount() const;

  // 남아 있는 연결 수를 반환하고 각각 ForceClose를 호출한다.
  std::size_t CloseAll();

 private:
  mutable std::mutex mutex_;
  Id next_id_{1};
  std::unordered_map<Id, std::weak_ptr<TrackedConnection>> connections_;
};

// 연결 객체 수명 동안 등록 상태를 유지한다.
class ConnectionRegistration {
 public:
  ConnectionRegistration() = default;
  ConnectionRegistration(std::shared_ptr<ConnectionTracker> tracker, const std::weak_ptr<TrackedConnection>& connection);
  ~ConnectionRegistration();
  ConnectionRegistration(const ConnectionRegistration&) = delete;
  ConnectionRegistration& operator=(const ConnectionRegistration&) = delete;

 private:
  std::shared_ptr<ConnectionTracker> tracker_;
  ConnectionTracker::Id id_{0};
};

}  // namespace wallet
