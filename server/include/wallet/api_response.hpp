/*
 * 설명: 헬스체크와 오류 응답의 JSON 본문 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "wallet/http_types.hpp"

namespace wallet {

// ISO-8601 UTC, 밀리초 포함 (예: 2024-01-02T03:04:05.678Z)
std::string ToIsoString(std::chrono::system_clock::time_point tp);
std::string CurrentTimestamp();

nlohmann::json MakeHealthBody(std::string_view service, std::string_view version);
nlohmann::json MakeNotFoundBody(std::string_view original_url);
nlohmann::json MakeErrorBody(std::string_view message, std::string_view code);

// 요청 대상 같은 외부 바이트가 UTF-8이 아니면 U+FFFD로 바꿔 직렬화한다.
std::string DumpJson(const nlohmann::json& value);

void WriteJson(HttpResponse& res, boost::beast::http::status status, const nlohmann::json& body);

}  // namespace wallet
