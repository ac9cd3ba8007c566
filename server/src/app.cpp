/*
 * 설명: 서비스 수명주기, 리스너, 시그널 기반 그레이스풀 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/startup_test.cpp, server/tests/e2e/graceful_shutdown_test.cpp,
 *         server/tests/e2e/health_routes_test.cpp
 */
#include "wallet/app.hpp"

#include <csignal>
#include <functional>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "wallet/http_session.hpp"

namespace wallet {
namespace {
constexpr std::chrono::milliseconds kDrainPollInterval{20};

std::string SignalName(int signal_number) {
  switch (signal_number) {
    case SIGINT:
      return "SIGINT";
    case SIGTERM:
      return "SIGTERM";
    default:
      return "signal " + std::to_string(signal_number);
  }
}
}  // namespace

std::string_view ToString(ServiceState state) {
  switch (state) {
    case ServiceState::kInitializing:
      return "initializing";
    case ServiceState::kReady:
      return "ready";
    case ServiceState::kShuttingDown:
      return "shutting_down";
    case ServiceState::kStopped:
      return "stopped";
  }
  return "unknown";
}

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<const RequestPipeline> pipeline, std::shared_ptr<Logger> logger,
           std::shared_ptr<ConnectionTracker> tracker)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), pipeline_(std::move(pipeline)),
        logger_(std::move(logger)), tracker_(std::move(tracker)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  // 새 연결 수락을 멈추고, 닫힌 뒤 on_closed를 호출한다.
  void Stop(std::function<void()> on_closed) {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this(), on_closed = std::move(on_closed)]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
      if (on_closed) {
        on_closed();
      }
    });
  }

  unsigned short LocalPort() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (ec == boost::asio::error::operation_aborted) {
            return;
          }
          if (ec) {
            self->logger_->Warn("Accept failed", {{"error", ec.message()}});
          } else if (self->acceptor_.is_open()) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->pipeline_, self->logger_,
                                          self->tracker_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<const RequestPipeline> pipeline_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<ConnectionTracker> tracker_;
};

ServiceApp::ServiceApp(const AppConfig& config, std::shared_ptr<Logger> logger, DependencyInitializer initializer,
                       std::shared_ptr<const Router> api_routes)
    : config_(config),
      logger_(std::move(logger)),
      initializer_(std::move(initializer)),
      ioc_(static_cast<int>(config.worker_threads)),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      strand_(boost::asio::make_strand(ioc_)),
      signals_(strand_, SIGINT, SIGTERM),
      drain_timer_(strand_),
      tracker_(std::make_shared<ConnectionTracker>()),
      pipeline_(std::make_shared<RequestPipeline>(config_, logger_, std::move(api_routes))) {}

ServiceApp::~ServiceApp() {
  work_guard_.reset();
  ioc_.stop();
  JoinWorkers();
}

int ServiceApp::Run() {
  if (started_.exchange(true)) {
    throw std::logic_error("ServiceApp::Run may only be called once");
  }

  if (initializer_.Initialize()) {
    state_ = ServiceState::kStopped;
    return kExitFailure;
  }

  try {
    listener_ = std::make_shared<Listener>(ioc_, ResolveEndpoint(), config_, pipeline_, logger_, tracker_);
  } catch (const std::exception& ex) {
    logger_->Error("Failed to start server", {{"error", ex.what()}, {"host", config_.host}, {"port", config_.port}});
    state_ = ServiceState::kStopped;
    return kExitFailure;
  }
  bound_port_ = listener_->LocalPort();
  state_ = ServiceState::kReady;
  listener_->Run();
  WaitForSignal();

  logger_->Info("Wallet Service running on " + config_.host + ":" + std::to_string(bound_port_.load()));
  logger_->Info("Environment: " + config_.node_env);
  logger_->Info("Default Provider: " + config_.default_wallet_provider);

  try {
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    logger_->Error("Server error", {{"error", ex.what()}});
    ioc_.stop();
  }
  JoinWorkers();
  return state_.load() == ServiceState::kStopped ? kExitOk : kExitFailure;
}

void ServiceApp::RequestShutdown(std::string signal_name) {
  boost::asio::post(strand_, [this, signal_name = std::move(signal_name)]() { OnTerminationSignal(signal_name); });
}

boost::asio::ip::tcp::endpoint ServiceApp::ResolveEndpoint() {
  boost::asio::ip::tcp::resolver resolver{ioc_};
  auto results = resolver.resolve(config_.host, std::to_string(config_.port));
  if (results.empty()) {
    throw std::runtime_error("cannot resolve host " + config_.host);
  }
  for (const auto& entry : results) {
    if (entry.endpoint().address().is_v4()) {
      return entry.endpoint();
    }
  }
  return results.begin()->endpoint();
}

void ServiceApp::WaitForSignal() {
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (ec) {
      logger_->Error("Signal wait failed", {{"error", ec.message()}});
      return;
    }
    OnTerminationSignal(SignalName(signal_number));
    // 종료 중에 들어온 시그널도 받아서 무시한다.
    WaitForSignal();
  });
}

void ServiceApp::OnTerminationSignal(const std::string& signal_name) {
  auto expected = ServiceState::kReady;
  if (!state_.compare_exchange_strong(expected, ServiceState::kShuttingDown)) {
    logger_->Debug("Ignoring termination signal", {{"signal", signal_name}, {"state", ToString(expected)}});
    return;
  }
  logger_->Info("Received " + signal_name + ". Shutting down gracefully...");
  listener_->Stop([this]() {
    boost::asio::post(strand_, [this]() {
      drain_deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.shutdown_timeout_ms);
      CheckDrain();
    });
  });
}

void ServiceApp::CheckDrain() {
  if (tracker_->ActiveCount() == 0) {
    return FinishShutdown();
  }
  if (std::chrono::steady_clock::now() >= drain_deadline_) {
    auto forced = tracker_->CloseAll();
    logger_->Warn("Drain timeout elapsed, closing remaining connections",
                  {{"connections", forced}, {"timeoutMs", config_.shutdown_timeout_ms}});
    return FinishShutdown();
  }
  drain_timer_.expires_after(kDrainPollInterval);
  drain_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    CheckDrain();
  });
}

void ServiceApp::FinishShutdown() {
  listener_.reset();
  logger_->Info("Server closed");
  state_ = ServiceState::kStopped;
  // 남은 작업(강제 종료된 연결의 정리)이 끝나면 run()이 반환된다.
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  work_guard_.reset();
}

void ServiceApp::RunWorkers() {
  // 현재 스레드도 run()을 호출하므로 워커는 worker_threads - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < config_.worker_threads; ++i) {
    workers_.emplace_back([this]() {
      try {
        ioc_.run();
      } catch (const std::exception& ex) {
        logger_->Error("Worker thread error", {{"error", ex.what()}});
        ioc_.stop();
      }
    });
  }
}

void ServiceApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

}  // namespace wallet
