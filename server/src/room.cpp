/*
 * 설명: 도메인 열거형 변환과 방/제출 판정 헬퍼, 판정 목록 JSON 직렬화를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_model_test.cpp
 */
#include "arena/room.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace arena {
namespace {
std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

int StatusRank(RoomStatus status) {
  switch (status) {
    case RoomStatus::kWaiting:
      return 0;
    case RoomStatus::kStarting:
      return 1;
    case RoomStatus::kInProgress:
      return 2;
    case RoomStatus::kFinished:
    case RoomStatus::kExpired:
      return 3;
  }
  return 0;
}
}  // namespace

const char* ToString(RoomStatus status) {
  switch (status) {
    case RoomStatus::kWaiting:
      return "waiting";
    case RoomStatus::kStarting:
      return "starting";
    case RoomStatus::kInProgress:
      return "in_progress";
    case RoomStatus::kFinished:
      return "finished";
    case RoomStatus::kExpired:
      return "expired";
  }
  return "waiting";
}

const char* ToString(Language language) {
  switch (language) {
    case Language::kPython:
      return "python";
    case Language::kJavaScript:
      return "javascript";
    case Language::kC:
      return "c";
    case Language::kCpp:
      return "cpp";
    case Language::kJava:
      return "java";
  }
  return "python";
}

const char* ToString(SubmissionResult result) {
  switch (result) {
    case SubmissionResult::kPending:
      return "pending";
    case SubmissionResult::kAccepted:
      return "accepted";
    case SubmissionResult::kRejected:
      return "rejected";
  }
  return "pending";
}

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kCompileError:
      return "compile_error";
    case ErrorKind::kRuntimeError:
      return "runtime_error";
    case ErrorKind::kTimeLimitExceeded:
      return "time_limit_exceeded";
  }
  return "runtime_error";
}

const char* ToString(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::kFull:
      return "full";
    case OutcomeKind::kPartial:
      return "partial";
    case OutcomeKind::kTimeout:
      return "timeout";
  }
  return "timeout";
}

const char* ToString(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::kEasy:
      return "easy";
    case Difficulty::kMedium:
      return "medium";
    case Difficulty::kHard:
      return "hard";
    case Difficulty::kUnknown:
      return "unknown";
  }
  return "unknown";
}

std::optional<RoomStatus> ParseRoomStatus(const std::string& text) {
  for (auto status : {RoomStatus::kWaiting, RoomStatus::kStarting, RoomStatus::kInProgress, RoomStatus::kFinished,
                      RoomStatus::kExpired}) {
    if (text == ToString(status)) {
      return status;
    }
  }
  return std::nullopt;
}

std::optional<Language> ParseLanguage(const std::string& text) {
  auto lowered = Lower(text);
  if (lowered == "c++") {
    return Language::kCpp;
  }
  for (auto language : {Language::kPython, Language::kJavaScript, Language::kC, Language::kCpp, Language::kJava}) {
    if (lowered == ToString(language)) {
      return language;
    }
  }
  return std::nullopt;
}

std::optional<SubmissionResult> ParseSubmissionResult(const std::string& text) {
  for (auto result : {SubmissionResult::kPending, SubmissionResult::kAccepted, SubmissionResult::kRejected}) {
    if (text == ToString(result)) {
      return result;
    }
  }
  return std::nullopt;
}

std::optional<ErrorKind> ParseErrorKind(const std::string& text) {
  for (auto kind : {ErrorKind::kCompileError, ErrorKind::kRuntimeError, ErrorKind::kTimeLimitExceeded}) {
    if (text == ToString(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<OutcomeKind> ParseOutcomeKind(const std::string& text) {
  for (auto kind : {OutcomeKind::kFull, OutcomeKind::kPartial, OutcomeKind::kTimeout}) {
    if (text == ToString(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

Difficulty ParseDifficulty(const std::string& text) {
  auto lowered = Lower(text);
  if (lowered == "easy") {
    return Difficulty::kEasy;
  }
  if (lowered == "medium") {
    return Difficulty::kMedium;
  }
  if (lowered == "hard") {
    return Difficulty::kHard;
  }
  return Difficulty::kUnknown;
}

bool IsCompiled(Language language) {
  return language == Language::kC || language == Language::kCpp || language == Language::kJava;
}

bool IsForwardTransition(RoomStatus from, RoomStatus to) { return StatusRank(to) > StatusRank(from); }

std::int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::size_t Submission::PassedHiddenCount() const {
  return static_cast<std::size_t>(std::count_if(test_results.begin(), test_results.end(), [](const TestVerdict& v) {
    return v.passed && !v.is_sample;
  }));
}

bool Room::HasSubmitted(const std::string& user_id) const {
  return std::any_of(submissions.begin(), submissions.end(),
                     [&](const Submission& s) { return s.user_id == user_id; });
}

bool Room::BothSubmitted() const {
  return opponent_id && HasSubmitted(host_id) && HasSubmitted(*opponent_id);
}

nlohmann::json ToJson(const TestVerdict& verdict) {
  nlohmann::json j{{"testCaseIndex", verdict.index},
                   {"passed", verdict.passed},
                   {"actualOutput", verdict.actual_output},
                   {"executionTimeMs", verdict.execution_time_ms},
                   {"isSample", verdict.is_sample}};
  if (verdict.error_kind) {
    j["errorKind"] = ToString(*verdict.error_kind);
    j["errorDetail"] = verdict.error_detail;
  } else {
    j["errorKind"] = nullptr;
  }
  return j;
}

TestVerdict VerdictFromJson(const nlohmann::json& j) {
  TestVerdict verdict;
  verdict.index = j.value("testCaseIndex", std::size_t{0});
  verdict.passed = j.value("passed", false);
  verdict.actual_output = j.value("actualOutput", std::string{});
  verdict.execution_time_ms = j.value("executionTimeMs", 0L);
  verdict.is_sample = j.value("isSample", false);
  auto kind_it = j.find("errorKind");
  if (kind_it != j.end() && kind_it->is_string()) {
    verdict.error_kind = ParseErrorKind(kind_it->get<std::string>());
    verdict.error_detail = j.value("errorDetail", std::string{});
  }
  return verdict;
}

nlohmann::json VerdictsToJson(const std::vector<TestVerdict>& verdicts) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& v : verdicts) {
    arr.push_back(ToJson(v));
  }
  return arr;
}

std::vector<TestVerdict> VerdictsFromJson(const nlohmann::json& j) {
  std::vector<TestVerdict> verdicts;
  if (!j.is_array()) {
    return verdicts;
  }
  for (const auto& item : j) {
    verdicts.push_back(VerdictFromJson(item));
  }
  return verdicts;
}

}  // namespace arena
