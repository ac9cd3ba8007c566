/*
 * 설명: 응답 보안 헤더, CORS, 본문 디코딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/middleware_test.cpp
 */
#include "wallet/middleware.hpp"

#include <algorithm>
#include <cctype>

#include "wallet/http_error.hpp"
#include "wallet/router.hpp"

namespace wallet {
namespace {
namespace http = boost::beast::http;

constexpr const char* kContentSecurityPolicy =
    "default-src 'self';base-uri 'self';font-src 'self' https: data:;form-action 'self';"
    "frame-ancestors 'self';img-src 'self' data:;object-src 'none';script-src 'self';"
    "script-src-attr 'none';style-src 'self' https: 'unsafe-inline';upgrade-insecure-requests";

constexpr const char* kAllowedMethods = "GET,HEAD,PUT,PATCH,POST,DELETE";

std::string MediaType(std::string_view content_type) {
  auto semi = content_type.find(';');
  auto media = content_type.substr(0, semi);
  while (!media.empty() && std::isspace(static_cast<unsigned char>(media.back()))) {
    media.remove_suffix(1);
  }
  while (!media.empty() && std::isspace(static_cast<unsigned char>(media.front()))) {
    media.remove_prefix(1);
  }
  std::string lowered(media);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}
}  // namespace

void ApplySecurityHeaders(HttpResponse& res) {
  res.set("Content-Security-Policy", kContentSecurityPolicy);
  res.set("Cross-Origin-Opener-Policy", "same-origin");
  res.set("Cross-Origin-Resource-Policy", "same-origin");
  res.set("Origin-Agent-Cluster", "?1");
  res.set("Referrer-Policy", "no-referrer");
  res.set("Strict-Transport-Security", "max-age=15552000; includeSubDomains");
  res.set("X-Content-Type-Options", "nosniff");
  res.set("X-DNS-Prefetch-Control", "off");
  res.set("X-Download-Options", "noopen");
  res.set("X-Frame-Options", "SAMEORIGIN");
  res.set("X-Permitted-Cross-Domain-Policies", "none");
  res.set("X-XSS-Protection", "0");
}

CorsPolicy::CorsPolicy(std::vector<std::string> allowed_origins) : allowed_origins_(std::move(allowed_origins)) {}

bool CorsPolicy::IsAllowed(std::string_view origin) const {
  return std::find(allowed_origins_.begin(), allowed_origins_.end(), origin) != allowed_origins_.end();
}

bool CorsPolicy::Apply(const HttpRequest& req, HttpResponse& res) const {
  auto origin_it = req.find(http::field::origin);
  if (origin_it != req.end()) {
    std::string origin(origin_it->value());
    if (IsAllowed(origin)) {
      res.set(http::field::access_control_allow_origin, origin);
      res.set(http::field::access_control_allow_credentials, "true");
    }
    res.set(http::field::vary, "Origin");
  }

  bool preflight = req.method() == http::verb::options &&
                   req.find(http::field::access_control_request_method) != req.end();
  if (!preflight) {
    return false;
  }
  res.set(http::field::access_control_allow_methods, kAllowedMethods);
  auto headers_it = req.find(http::field::access_control_request_headers);
  if (headers_it != req.end()) {
    res.set(http::field::access_control_allow_headers, headers_it->value());
    res.set(http::field::vary, "Origin, Access-Control-Request-Headers");
  }
  res.result(http::status::no_content);
  res.body().clear();
  res.content_length(0);
  return true;
}

void DecodeBody(RequestContext& ctx) {
  auto type_it = ctx.request.find(http::field::content_type);
  if (type_it == ctx.request.end() || ctx.request.body().empty()) {
    return;
  }
  auto media = MediaType(std::string(type_it->value()));
  if (media == "application/json" || (media.size() > 5 && media.compare(media.size() - 5, 5, "+json") == 0)) {
    auto parsed = nlohmann::json::parse(ctx.request.body(), nullptr, false);
    // 최상위는 객체나 배열만 허용한다.
    if (parsed.is_discarded() || !(parsed.is_object() || parsed.is_array())) {
      throw BadRequest("Request body is not valid JSON", "INVALID_JSON");
    }
    ctx.json_body = std::move(parsed);
    return;
  }
  if (media == "application/x-www-form-urlencoded") {
    ctx.form_fields = ParseUrlEncoded(ctx.request.body());
  }
}

}  // namespace wallet
