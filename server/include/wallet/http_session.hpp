/*
 * 설명: HTTP 연결 하나를 읽고, 요청 파이프라인으로 처리한 뒤 응답을 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/health_routes_test.cpp, server/tests/e2e/graceful_shutdown_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "wallet/config.hpp"
#include "wallet/connection_tracker.hpp"
#include "wallet/http_types.hpp"
#include "wallet/logger.hpp"
#include "wallet/request_pipeline.hpp"

namespace wallet {

class HttpSession : public TrackedConnection, public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<const RequestPipeline> pipeline, std::shared_ptr<Logger> logger,
              std::shared_ptr<ConnectionTracker> tracker);
  void Run();
  void ForceClose() override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void RejectOversizedBody();
  void SendResponse(std::shared_ptr<HttpResponse> res, const std::string& method, const std::string& target);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
  std::size_t body_limit_bytes_;
  std::chrono::seconds read_timeout_;
  std::shared_ptr<const RequestPipeline> pipeline_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<ConnectionTracker> tracker_;
  std::optional<ConnectionRegistration> registration_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace wallet
