/*
 * 설명: 대결 방(Room), 제출, 테스트 케이스, 판정 등 도메인 모델과 직렬화를 정의한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_model_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace arena {

enum class RoomStatus { kWaiting, kStarting, kInProgress, kFinished, kExpired };
enum class Language { kPython, kJavaScript, kC, kCpp, kJava };
enum class SubmissionResult { kPending, kAccepted, kRejected };
enum class ErrorKind { kCompileError, kRuntimeError, kTimeLimitExceeded };
enum class OutcomeKind { kFull, kPartial, kTimeout };
enum class Difficulty { kEasy, kMedium, kHard, kUnknown };

const char* ToString(RoomStatus status);
const char* ToString(Language language);
const char* ToString(SubmissionResult result);
const char* ToString(ErrorKind kind);
const char* ToString(OutcomeKind kind);
const char* ToString(Difficulty difficulty);

std::optional<RoomStatus> ParseRoomStatus(const std::string& text);
// 대소문자를 구분하지 않으며 "c++"는 cpp로 취급한다.
std::optional<Language> ParseLanguage(const std::string& text);
std::optional<SubmissionResult> ParseSubmissionResult(const std::string& text);
std::optional<ErrorKind> ParseErrorKind(const std::string& text);
std::optional<OutcomeKind> ParseOutcomeKind(const std::string& text);
Difficulty ParseDifficulty(const std::string& text);

bool IsCompiled(Language language);
// 상태 순서상 to가 from보다 뒤에 있을 때만 true. finished/expired 간 이동은 허용하지 않는다.
bool IsForwardTransition(RoomStatus from, RoomStatus to);

std::int64_t NowMs();

struct TestCase {
  std::string input;
  std::string expected_output;
};

struct TestVerdict {
  std::size_t index{0};
  bool passed{false};
  std::string actual_output;
  long execution_time_ms{0};
  std::optional<ErrorKind> error_kind;
  std::string error_detail;
  bool is_sample{false};
};

struct Submission {
  std::string user_id;
  std::string code;
  Language language{Language::kPython};
  SubmissionResult result{SubmissionResult::kPending};
  std::vector<TestVerdict> test_results;
  std::int64_t submitted_at_ms{0};

  // 숨김 케이스 기준 통과 수. 부분 점수 비교에 쓰인다.
  std::size_t PassedHiddenCount() const;
};

struct Room {
  std::string room_id;
  std::string problem_id;
  std::string host_id;
  std::optional<std::string> opponent_id;
  RoomStatus status{RoomStatus::kWaiting};
  std::int64_t created_at_ms{0};
  std::int64_t lobby_expires_at_ms{0};
  std::optional<std::int64_t> started_at_ms;
  std::optional<std::int64_t> finished_at_ms;
  std::optional<std::int64_t> match_duration_seconds;
  bool host_ready{false};
  bool opponent_ready{false};
  std::optional<std::string> winner_id;
  std::optional<OutcomeKind> outcome_kind;
  std::vector<Submission> submissions;

  bool IsHost(const std::string& user_id) const { return host_id == user_id; }
  bool IsOpponent(const std::string& user_id) const { return opponent_id && *opponent_id == user_id; }
  bool IsParticipant(const std::string& user_id) const { return IsHost(user_id) || IsOpponent(user_id); }
  bool IsFull() const { return opponent_id.has_value(); }
  bool BothReady() const { return IsFull() && host_ready && opponent_ready; }
  bool IsTerminal() const { return status == RoomStatus::kFinished || status == RoomStatus::kExpired; }
  bool HasSubmitted(const std::string& user_id) const;
  bool BothSubmitted() const;
};

nlohmann::json ToJson(const TestVerdict& verdict);
TestVerdict VerdictFromJson(const nlohmann::json& j);
nlohmann::json VerdictsToJson(const std::vector<TestVerdict>& verdicts);
std::vector<TestVerdict> VerdictsFromJson(const nlohmann::json& j);

}  // namespace arena
