/*
 * 설명: 보안 헤더 -> CORS -> 본문 디코딩 -> 라우팅 -> 404 -> 오류 처리 순서의 요청 파이프라인.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/request_pipeline_test.cpp, server/tests/e2e/health_routes_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "wallet/config.hpp"
#include "wallet/http_types.hpp"
#include "wallet/logger.hpp"
#include "wallet/middleware.hpp"
#include "wallet/router.hpp"

namespace wallet {

constexpr const char* kApiPrefix = "/api/v1";

class RequestPipeline {
 public:
  RequestPipeline(const AppConfig& config, std::shared_ptr<Logger> logger, std::shared_ptr<const Router> api_routes);
  RequestPipeline(const RequestPipeline&) = delete;
  RequestPipeline& operator=(const RequestPipeline&) = delete;

  // 항상 완성된 응답을 반환한다. 핸들러 예외는 오류 응답으로 바뀐다.
  HttpResponse Handle(const HttpRequest& req, const std::string& trace_id) const;

 private:
  void HandleHealth(RequestContext& ctx, HttpResponse& res) const;

  AppConfig config_;
  std::shared_ptr<Logger> logger_;
  CorsPolicy cors_;
  Router router_;
};

}  // namespace wallet
