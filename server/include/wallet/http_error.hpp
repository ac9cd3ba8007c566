/*
 * 설명: 핸들러가 던지는 HTTP 오류(상태 코드 + 오류 코드)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/error_handler_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

#include <boost/beast/http/status.hpp>

namespace wallet {

class HttpError : public std::runtime_error {
 public:
  HttpError(boost::beast::http::status status, const std::string& message, std::string code = "INTERNAL_ERROR")
      : std::runtime_error(message), status(status), code(std::move(code)) {}
  boost::beast::http::status status;
  std::string code;
};

inline HttpError BadRequest(const std::string& message = "Bad Request", const std::string& code = "BAD_REQUEST") {
  return HttpError(boost::beast::http::status::bad_request, message, code);
}

inline HttpError Unauthorized(const std::string& message = "Unauthorized", const std::string& code = "UNAUTHORIZED") {
  return HttpError(boost::beast::http::status::unauthorized, message, code);
}

inline HttpError Forbidden(const std::string& message = "Forbidden", const std::string& code = "FORBIDDEN") {
  return HttpError(boost::beast::http::status::forbidden, message, code);
}

inline HttpError NotFound(const std::string& message = "Resource not found", const std::string& code = "NOT_FOUND") {
  return HttpError(boost::beast::http::status::not_found, message, code);
}

inline HttpError Conflict(const std::string& message = "Conflict", const std::string& code = "CONFLICT") {
  return HttpError(boost::beast::http::status::conflict, message, code);
}

inline HttpError PayloadTooLarge(const std::string& message = "request entity too large") {
  return HttpError(boost::beast::http::status::payload_too_large, message, "PAYLOAD_TOO_LARGE");
}

}  // namespace wallet
