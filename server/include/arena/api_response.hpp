/*
 * 설명: REST/WS 응답 엔벨로프를 만들고 오류 코드별 HTTP 상태와 재시도 가능 여부를 정한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace arena {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
// error.retryable은 IsRetryableError(code)로 채운다.
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// 오류 코드별 HTTP 상태. 목록에 없는 코드는 상태 충돌(409)로 본다.
unsigned int HttpStatusForError(std::string_view code);
bool IsRetryableError(std::string_view code);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

std::string ToIsoString(std::int64_t epoch_ms);

}  // namespace arena
