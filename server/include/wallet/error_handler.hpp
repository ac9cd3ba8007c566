/*
 * 설명: 핸들러에서 빠져나온 예외를 JSON 오류 응답으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/error_handler_test.cpp
 */
#pragma once

#include <exception>

#include "wallet/http_types.hpp"
#include "wallet/logger.hpp"

namespace wallet {

// HttpError는 자신의 상태/코드를, 그 밖의 예외는 500 INTERNAL_ERROR를 사용한다.
// include_request_detail이면 본문에 path, method를 추가한다.
void HandleError(std::exception_ptr error, const RequestContext& ctx, HttpResponse& res, const Logger& logger,
                 bool include_request_detail);

}  // namespace wallet
