/*
 * 설명: 요청 파이프라인 구성과 단계별 실행을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/request_pipeline_test.cpp, server/tests/e2e/health_routes_test.cpp
 */
#include "wallet/request_pipeline.hpp"

#include <exception>

#include "wallet/api_response.hpp"
#include "wallet/error_handler.hpp"

namespace wallet {

RequestPipeline::RequestPipeline(const AppConfig& config, std::shared_ptr<Logger> logger,
                                 std::shared_ptr<const Router> api_routes)
    : config_(config), logger_(std::move(logger)), cors_(config.cors_origins) {
  router_.Get("/health", [this](RequestContext& ctx, HttpResponse& res) { HandleHealth(ctx, res); });
  // HEAD는 GET과 같은 헤더에 본문만 비운다.
  router_.Add(boost::beast::http::verb::head, "/health", [this](RequestContext& ctx, HttpResponse& res) {
    HandleHealth(ctx, res);
    auto length = res.body().size();
    res.body().clear();
    res.content_length(length);
  });
  router_.Mount(kApiPrefix, std::move(api_routes));
}

HttpResponse RequestPipeline::Handle(const HttpRequest& req, const std::string& trace_id) const {
  HttpResponse res;
  res.version(req.version());
  res.keep_alive(req.keep_alive());

  RequestContext ctx(req);
  ctx.trace_id = trace_id;
  SplitTarget(ctx);

  ApplySecurityHeaders(res);
  if (cors_.Apply(req, res)) {
    return res;
  }

  try {
    DecodeBody(ctx);
    if (!router_.Dispatch(ctx, res)) {
      WriteJson(res, boost::beast::http::status::not_found, MakeNotFoundBody(ctx.target));
    }
  } catch (...) {
    HandleError(std::current_exception(), ctx, res, *logger_, config_.IsDevelopment());
  }
  return res;
}

void RequestPipeline::HandleHealth(RequestContext& /*ctx*/, HttpResponse& res) const {
  WriteJson(res, boost::beast::http::status::ok, MakeHealthBody(config_.service_name, config_.service_version));
}

}  // namespace wallet
