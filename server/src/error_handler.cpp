/*
 * 설명: 전역 오류 처리기. 예외를 로그로 남기고 {error, code} 응답을 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/error_handler_test.cpp
 */
#include "wallet/error_handler.hpp"

#include <string>

#include "wallet/api_response.hpp"
#include "wallet/http_error.hpp"

namespace wallet {

void HandleError(std::exception_ptr error, const RequestContext& ctx, HttpResponse& res, const Logger& logger,
                 bool include_request_detail) {
  auto status = boost::beast::http::status::internal_server_error;
  std::string code = "INTERNAL_ERROR";
  std::string message;
  try {
    std::rethrow_exception(error);
  } catch (const HttpError& ex) {
    status = ex.status;
    code = ex.code;
    message = ex.what();
  } catch (const std::exception& ex) {
    message = ex.what();
  } catch (...) {
    message = "unknown exception";
  }
  if (message.empty()) {
    message = "Internal server error";
  }

  std::string method(boost::beast::http::to_string(ctx.request.method()));
  logger.Error("Unhandled error",
               {{"error", message}, {"code", code}, {"url", ctx.target}, {"method", method},
                {"statusCode", static_cast<unsigned>(status)}, {"traceId", ctx.trace_id}});

  auto body = MakeErrorBody(message, code);
  if (include_request_detail) {
    body["path"] = ctx.path;
    body["method"] = method;
  }
  WriteJson(res, status, body);
}

}  // namespace wallet
