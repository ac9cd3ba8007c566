/*
 * 설명: 헬스체크/404/오류 JSON 본문을 만들고 응답에 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "wallet/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace wallet {

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  auto tt = system_clock::to_time_t(tp);
  auto millis = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
  if (millis < 0) {
    millis += 1000;
  }
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::string CurrentTimestamp() { return ToIsoString(std::chrono::system_clock::now()); }

nlohmann::json MakeHealthBody(std::string_view service, std::string_view version) {
  nlohmann::json body;
  body["status"] = "healthy";
  body["service"] = service;
  body["version"] = version;
  body["timestamp"] = CurrentTimestamp();
  return body;
}

nlohmann::json MakeNotFoundBody(std::string_view original_url) {
  nlohmann::json body;
  body["error"] = "Not Found";
  body["message"] = "Route " + std::string(original_url) + " not found";
  body["code"] = "ROUTE_NOT_FOUND";
  return body;
}

nlohmann::json MakeErrorBody(std::string_view message, std::string_view code) {
  return nlohmann::json{{"error", message}, {"code", code}};
}

std::string DumpJson(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void WriteJson(HttpResponse& res, boost::beast::http::status status, const nlohmann::json& body) {
  res.result(status);
  res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res.body() = DumpJson(body);
  res.prepare_payload();
}

}  // namespace wallet
