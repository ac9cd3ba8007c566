/*
 * 설명: 서비스 수명주기(초기화 -> 바인드 -> 준비 -> 드레인 -> 종료)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/startup_test.cpp, server/tests/e2e/graceful_shutdown_test.cpp,
 *         server/tests/e2e/health_routes_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "wallet/config.hpp"
#include "wallet/connection_tracker.hpp"
#include "wallet/dependency_initializer.hpp"
#include "wallet/logger.hpp"
#include "wallet/request_pipeline.hpp"
#include "wallet/router.hpp"

namespace wallet {

enum class ServiceState { kInitializing, kReady, kShuttingDown, kStopped };

std::string_view ToString(ServiceState state);

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

class Listener;

class ServiceApp {
 public:
  ServiceApp(const AppConfig& config, std::shared_ptr<Logger> logger, DependencyInitializer initializer,
             std::shared_ptr<const Router> api_routes);
  ~ServiceApp();
  ServiceApp(const ServiceApp&) = delete;
  ServiceApp& operator=(const ServiceApp&) = delete;

  // 초기화와 바인드에 성공하면 종료가 끝날 때까지 블록하고 kExitOk를 반환한다.
  // 초기화 또는 바인드에 실패하면 리스너를 열지 않고 kExitFailure를 반환한다.
  int Run();

  // SIGINT/SIGTERM과 같은 종료 경로. 어느 스레드에서 호출해도 된다.
  // Ready 이전에 요청되면 준비가 끝난 직후 처리된다.
  void RequestShutdown(std::string signal_name);

  ServiceState State() const { return state_.load(); }
  // 바인드 전에는 0
  unsigned short BoundPort() const { return bound_port_.load(); }
  std::size_t ActiveConnections() const { return tracker_->ActiveCount(); }
  const AppConfig& GetConfig() const { return config_; }

 private:
  boost::asio::ip::tcp::endpoint ResolveEndpoint();
  void WaitForSignal();
  void OnTerminationSignal(const std::string& signal_name);
  void CheckDrain();
  void FinishShutdown();
  void RunWorkers();
  void JoinWorkers();

  AppConfig config_;
  std::shared_ptr<Logger> logger_;
  DependencyInitializer initializer_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer drain_timer_;
  std::chrono::steady_clock::time_point drain_deadline_;
  std::shared_ptr<ConnectionTracker> tracker_;
  std::shared_ptr<const RequestPipeline> pipeline_;
  std::shared_ptr<Listener> listener_;
  std::vector<std::thread> workers_;
  std::atomic<ServiceState> state_{ServiceState::kInitializing};
  std::atomic<unsigned short> bound_port_{0};
  std::atomic<bool> started_{false};
};

}  // namespace wallet
