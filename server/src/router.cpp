/*
 * 설명: 경로 분해, URL 디코딩, 라우트 매칭을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/router_test.cpp
 */
#include "wallet/router.hpp"

#include <utility>

namespace wallet {
namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool MatchSegments(const std::vector<std::string>& pattern, const std::vector<std::string>& segments,
                   std::size_t offset, bool prefix_only, ParamMap& params) {
  if (segments.size() < offset + pattern.size()) {
    return false;
  }
  if (!prefix_only && segments.size() != offset + pattern.size()) {
    return false;
  }
  ParamMap captured;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const auto& part = pattern[i];
    const auto& actual = segments[offset + i];
    if (!part.empty() && part.front() == ':') {
      captured[part.substr(1)] = UrlDecode(actual, false);
    } else if (part != actual) {
      return false;
    }
  }
  for (auto& kv : captured) {
    params[kv.first] = std::move(kv.second);
  }
  return true;
}
}  // namespace

std::vector<std::string> SplitPath(std::string_view path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    auto slash = path.find('/', pos);
    auto end = slash == std::string_view::npos ? path.size() : slash;
    if (end > pos) {
      segments.emplace_back(path.substr(pos, end - pos));
    }
    if (slash == std::string_view::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}

std::string UrlDecode(std::string_view text, bool plus_as_space) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size()) {
      int hi = HexValue(text[i + 1]);
      int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out.push_back(' ');
      continue;
    }
    out.push_back(c);
  }
  return out;
}

ParamMap ParseUrlEncoded(std::string_view text) {
  ParamMap params;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto amp = text.find('&', pos);
    auto pair = text.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string_view::npos) {
        params.emplace(UrlDecode(pair, true), std::string{});
      } else {
        params.emplace(UrlDecode(pair.substr(0, eq), true), UrlDecode(pair.substr(eq + 1), true));
      }
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

void SplitTarget(RequestContext& ctx) {
  ctx.target = std::string(ctx.request.target());
  auto qpos = ctx.target.find('?');
  if (qpos == std::string::npos) {
    ctx.path = ctx.target;
    ctx.query.clear();
  } else {
    ctx.path = ctx.target.substr(0, qpos);
    ctx.query = ctx.target.substr(qpos + 1);
  }
  ctx.query_params = ParseUrlEncoded(ctx.query);
}

void Router::Add(boost::beast::http::verb method, std::string_view pattern, RouteHandler handler) {
  entries_.push_back(Entry{method, SplitPath(pattern), std::move(handler), nullptr});
}

void Router::Get(std::string_view pattern, RouteHandler handler) {
  Add(boost::beast::http::verb::get, pattern, std::move(handler));
}

void Router::Post(std::string_view pattern, RouteHandler handler) {
  Add(boost::beast::http::verb::post, pattern, std::move(handler));
}

void Router::Put(std::string_view pattern, RouteHandler handler) {
  Add(boost::beast::http::verb::put, pattern, std::move(handler));
}

void Router::Patch(std::string_view pattern, RouteHandler handler) {
  Add(boost::beast::http::verb::patch, pattern, std::move(handler));
}

void Router::Delete(std::string_view pattern, RouteHandler handler) {
  Add(boost::beast::http::verb::delete_, pattern, std::move(handler));
}

void Router::Mount(std::string_view prefix, std::shared_ptr<const Router> child) {
  if (!child) {
    return;
  }
  entries_.push_back(Entry{boost::beast::http::verb::unknown, SplitPath(prefix), RouteHandler{}, std::move(child)});
}

bool Router::Dispatch(RequestContext& ctx, HttpResponse& res) const {
  return DispatchFrom(SplitPath(ctx.path), 0, ctx, res);
}

bool Router::DispatchFrom(const std::vector<std::string>& segments, std::size_t offset, RequestContext& ctx,
                          HttpResponse& res) const {
  for (const auto& entry : entries_) {
    ParamMap params = ctx.path_params;
    if (entry.child) {
      if (!MatchSegments(entry.segments, segments, offset, true, params)) {
        continue;
      }
      auto saved = ctx.path_params;
      ctx.path_params = std::move(params);
      if (entry.child->DispatchFrom(segments, offset + entry.segments.size(), ctx, res)) {
        return true;
      }
      ctx.path_params = std::move(saved);
      continue;
    }
    if (entry.method != ctx.request.method()) {
      continue;
    }
    if (!MatchSegments(entry.segments, segments, offset, false, params)) {
      continue;
    }
    ctx.path_params = std::move(params);
    entry.handler(ctx, res);
    return true;
  }
  return false;
}

}  // namespace wallet
