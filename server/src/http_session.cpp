/*
 * 설명: 연결 단위 요청 읽기/응답 쓰기와 접근 로그, 강제 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/health_routes_test.cpp, server/tests/e2e/graceful_shutdown_test.cpp
 */
#include "wallet/http_session.hpp"

#include <exception>

#include <boost/asio/post.hpp>

#include "wallet/api_response.hpp"
#include "wallet/middleware.hpp"

namespace wallet {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<const RequestPipeline> pipeline, std::shared_ptr<Logger> logger,
                         std::shared_ptr<ConnectionTracker> tracker)
    : stream_(std::move(socket)), body_limit_bytes_(config.body_limit_bytes),
      read_timeout_(static_cast<std::chrono::seconds::rep>(config.request_timeout_seconds)),
      pipeline_(std::move(pipeline)), logger_(std::move(logger)), tracker_(std::move(tracker)) {}

void HttpSession::Run() {
  registration_.emplace(tracker_, shared_from_this());
  DoRead();
}

void HttpSession::ForceClose() {
  auto self = shared_from_this();
  boost::asio::post(stream_.get_executor(), [self]() {
    boost::beast::error_code ec;
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    self->stream_.close();
  });
}

void HttpSession::DoRead() {
  auto self = shared_from_this();
  parser_.emplace();
  parser_->body_limit(body_limit_bytes_);
  stream_.expires_after(read_timeout_);
  boost::beast::http::async_read(
      stream_, buffer_, *parser_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec == boost::beast::http::error::body_limit) {
    return RejectOversizedBody();
  }
  if (ec) {
    if (ec != boost::asio::error::operation_aborted && ec != boost::beast::error::timeout) {
      logger_->Debug("Connection read failed", {{"error", ec.message()}});
    }
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = logger_->NextTraceId();
  const auto& req = parser_->get();
  std::string method(boost::beast::http::to_string(req.method()));
  std::string target(req.target());

  std::shared_ptr<HttpResponse> res;
  try {
    res = std::make_shared<HttpResponse>(pipeline_->Handle(req, trace_id_));
  } catch (const std::exception& ex) {
    // 요청 하나의 실패가 io_context::run()까지 올라가지 않게 여기서 끊는다.
    logger_->Error("Request handling failed", {{"traceId", trace_id_}, {"error", ex.what()}});
    res = std::make_shared<HttpResponse>();
    res->version(req.version());
    ApplySecurityHeaders(*res);
    WriteJson(*res, boost::beast::http::status::internal_server_error,
              MakeErrorBody("Internal server error", "INTERNAL_ERROR"));
  }
  // 응답 하나를 쓰고 연결을 닫는다.
  res->keep_alive(false);
  SendResponse(res, method, target);
}

void HttpSession::RejectOversizedBody() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = logger_->NextTraceId();
  const auto& req = parser_->get();
  std::string method(boost::beast::http::to_string(req.method()));
  std::string target(req.target());
  logger_->Warn("Request body exceeds limit",
                {{"traceId", trace_id_}, {"url", target}, {"limitBytes", body_limit_bytes_}});

  auto res = std::make_shared<HttpResponse>();
  res->version(req.version());
  ApplySecurityHeaders(*res);
  WriteJson(*res, boost::beast::http::status::payload_too_large,
            MakeErrorBody("request entity too large", "PAYLOAD_TOO_LARGE"));
  res->keep_alive(false);
  SendResponse(res, method, target);
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res, const std::string& method,
                               const std::string& target) {
  auto self = shared_from_this();
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  logger_->Info("request", {{"traceId", trace_id_},
                            {"method", method},
                            {"path", target},
                            {"status", res->result_int()},
                            {"latencyMs", latency}});
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace wallet
