/*
 * 설명: (메서드, 경로 패턴) 라우팅 테이블과 prefix 마운트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/router_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "wallet/http_types.hpp"

namespace wallet {

using RouteHandler = std::function<void(RequestContext&, HttpResponse&)>;

// 패턴의 ":name" 세그먼트는 path_params["name"]으로 캡처된다.
// 등록 순서대로 검사하며, 처음 일치한 항목만 실행한다.
class Router {
 public:
  void Add(boost::beast::http::verb method, std::string_view pattern, RouteHandler handler);
  void Get(std::string_view pattern, RouteHandler handler);
  void Post(std::string_view pattern, RouteHandler handler);
  void Put(std::string_view pattern, RouteHandler handler);
  void Patch(std::string_view pattern, RouteHandler handler);
  void Delete(std::string_view pattern, RouteHandler handler);
  void Mount(std::string_view prefix, std::shared_ptr<const Router> child);

  bool Dispatch(RequestContext& ctx, HttpResponse& res) const;
  bool Empty() const { return entries_.empty(); }

 private:
  struct Entry {
    boost::beast::http::verb method;
    std::vector<std::string> segments;
    RouteHandler handler;
    std::shared_ptr<const Router> child;
  };

  bool DispatchFrom(const std::vector<std::string>& segments, std::size_t offset, RequestContext& ctx,
                    HttpResponse& res) const;

  std::vector<Entry> entries_;
};

std::vector<std::string> SplitPath(std::string_view path);
std::string UrlDecode(std::string_view text, bool plus_as_space);
ParamMap ParseUrlEncoded(std::string_view text);
// target을 path와 query로 나누고 query 파라미터를 디코딩해 채운다.
void SplitTarget(RequestContext& ctx);

}  // namespace wallet
