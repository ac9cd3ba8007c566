/*
 * 설명: 활성 연결 등록/해제와 강제 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_tracker_test.cpp
 */
#include "wallet/connection_tracker.hpp"

#include <vector>

namespace wallet {

ConnectionTracker::Id ConnectionTracker::Register(const std::weak_ptr<TrackedConnection>& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_id_++;
  connections_.emplace(id, connection);
  return id;
}

void ConnectionTracker::Unregister(Id id) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_.erase(id);
}

std::size_t ConnectionTracker::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t ConnectionTracker::CloseAll() {
  std::vector<std::shared_ptr<TrackedConnection>> alive;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    count = connections_.size();
    for (auto& kv : connections_) {
      if (auto conn = kv.second.lock()) {
        alive.push_back(std::move(conn));
      }
    }
  }
  // ForceClose가 소멸자를 거쳐 Unregister를 부를 수 있으므로 락 밖에서 호출한다.
  for (auto& conn : alive) {
    conn->ForceClose();
  }
  return count;
}

ConnectionRegistration::ConnectionRegistration(std::shared_ptr<ConnectionTracker> tracker,
                                               const std::weak_ptr<TrackedConnection>& connection)
    : tracker_(std::move(tracker)) {
  if (tracker_) {
    id_ = tracker_->Register(connection);
  }
}

ConnectionRegistration::~ConnectionRegistration() {
  if (tracker_) {
    tracker_->Unregister(id_);
  }
}

}  // namespace wallet
