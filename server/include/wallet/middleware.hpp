/*
 * 설명: 보안 헤더, CORS 정책, 요청 본문 디코딩 미들웨어를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/middleware_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "wallet/http_types.hpp"

namespace wallet {

void ApplySecurityHeaders(HttpResponse& res);

class CorsPolicy {
 public:
  explicit CorsPolicy(std::vector<std::string> allowed_origins);

  bool IsAllowed(std::string_view origin) const;

  // 허용된 Origin이면 CORS 헤더를 붙인다.
  // preflight 요청이면 204 응답을 완성하고 true를 반환한다.
  bool Apply(const HttpRequest& req, HttpResponse& res) const;

 private:
  std::vector<std::string> allowed_origins_;
};

// application/json, application/x-www-form-urlencoded 본문을 ctx에 채운다.
// JSON이 올바르지 않으면 HttpError(400, INVALID_JSON)를 던진다.
void DecodeBody(RequestContext& ctx);

}  // namespace wallet
