/*
 * 설명: HTTP 요청/응답 타입과 파이프라인이 공유하는 요청 컨텍스트를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/router_test.cpp, server/tests/unit/middleware_test.cpp
 */
#pragma once

#include <string>
#include <unordered_map>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace wallet {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using ParamMap = std::unordered_map<std::string, std::string>;

struct RequestContext {
  explicit RequestContext(const HttpRequest& req) : request(req) {}

  const HttpRequest& request;
  std::string target;
  std::string path;
  std::string query;
  ParamMap query_params;
  ParamMap path_params;
  // 본문이 JSON이 아니면 null
  nlohmann::json json_body;
  ParamMap form_fields;
  std::string trace_id;
};

}  // namespace wallet
