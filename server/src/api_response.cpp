/*
 * 설명: REST/WS 응답 엔벨로프를 만들고 오류 코드별 HTTP 상태와 재시도 가능 여부를 정한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "arena/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arena {
namespace {
std::string CurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  return ToIsoString(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}
}  // namespace

std::string ToIsoString(std::int64_t epoch_ms) {
  std::time_t tt = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << (epoch_ms % 1000) << 'Z';
  return oss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"retryable", IsRetryableError(code)}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

unsigned int HttpStatusForError(std::string_view code) {
  if (code == "bad_request" || code == "unsupported_language" || code == "language_not_allowed") {
    return 400;
  }
  if (code == "unauthorized") {
    return 401;
  }
  if (code == "not_participant" || code == "spectate_unavailable") {
    return 403;
  }
  if (code == "room_not_found" || code == "problem_not_found" || code == "not_found") {
    return 404;
  }
  if (IsRetryableError(code)) {
    return 503;
  }
  return 409;
}

bool IsRetryableError(std::string_view code) {
  return code == "store_unavailable" || code == "room_id_exhausted";
}

}  // namespace arena
