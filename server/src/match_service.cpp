/*
 * 설명: 대결 방 생명주기 조율을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_flow_test.cpp, server/tests/unit/room_state_test.cpp,
 *         server/tests/e2e/challenge_flow_test.cpp
 */
#include "arena/match_service.hpp"

#include <boost/asio/post.hpp>

#include "arena/api_response.hpp"
#include "arena/room_id.hpp"

namespace arena {
namespace {
constexpr std::int64_t kExpireRetryDelayMs = 5000;
constexpr int kScoreResolveAttempts = 3;

nlohmann::json OptionalJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json OptionalTime(const std::optional<std::int64_t>& value) {
  return value ? nlohmann::json(ToIsoString(*value)) : nlohmann::json(nullptr);
}

void MapStoreError(StoreError error, std::string& error_code, std::string& error_message) {
  switch (error) {
    case StoreError::kNotFound:
      error_code = "room_not_found";
      error_message = "방을 찾을 수 없습니다";
      break;
    case StoreError::kExpired:
      error_code = "room_expired";
      error_message = "대기 시간이 지나 만료된 방입니다";
      break;
    case StoreError::kFull:
      error_code = "room_full";
      error_message = "이미 상대가 참가한 방입니다";
      break;
    case StoreError::kSelfJoin:
      error_code = "self_join";
      error_message = "자신이 만든 방에는 참가할 수 없습니다";
      break;
    case StoreError::kNotJoinable:
      error_code = "room_not_joinable";
      error_message = "참가할 수 없는 상태의 방입니다";
      break;
    case StoreError::kNotParticipant:
      error_code = "not_participant";
      error_message = "이 방의 참가자가 아닙니다";
      break;
    case StoreError::kNotStarting:
      error_code = "room_not_starting";
      error_message = "준비 단계가 아닌 방입니다";
      break;
    case StoreError::kNone:
      break;
  }
}
}  // namespace

nlohmann::json RedactedVerdictsToJson(const std::vector<TestVerdict>& verdicts) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& verdict : verdicts) {
    if (verdict.is_sample) {
      out.push_back(ToJson(verdict));
      continue;
    }
    nlohmann::json j{{"testCaseIndex", verdict.index},
                     {"passed", verdict.passed},
                     {"executionTimeMs", verdict.execution_time_ms},
                     {"isSample", false}};
    if (verdict.error_kind) {
      j["errorKind"] = ToString(*verdict.error_kind);
    }
    out.push_back(std::move(j));
  }
  return out;
}

nlohmann::json RoomToJson(const Room& room, const std::optional<Problem>& problem, bool privileged) {
  nlohmann::json submissions = nlohmann::json::array();
  for (const auto& submission : room.submissions) {
    std::size_t passed = 0;
    for (const auto& verdict : submission.test_results) {
      passed += verdict.passed ? 1 : 0;
    }
    nlohmann::json j{{"userId", submission.user_id},
                     {"language", ToString(submission.language)},
                     {"result", ToString(submission.result)},
                     {"submittedAt", ToIsoString(submission.submitted_at_ms)},
                     {"passedCount", passed},
                     {"totalCount", submission.test_results.size()},
                     {"passedHiddenCount", submission.PassedHiddenCount()}};
    if (privileged) {
      j["code"] = submission.code;
      j["testResults"] = VerdictsToJson(submission.test_results);
    } else {
      j["testResults"] = RedactedVerdictsToJson(submission.test_results);
    }
    submissions.push_back(std::move(j));
  }

  nlohmann::json view{{"roomId", room.room_id},
                      {"problemId", room.problem_id},
                      {"hostId", room.host_id},
                      {"opponentId", OptionalJson(room.opponent_id)},
                      {"status", ToString(room.status)},
                      {"createdAt", ToIsoString(room.created_at_ms)},
                      {"expiresAt", ToIsoString(room.lobby_expires_at_ms)},
                      {"startedAt", OptionalTime(room.started_at_ms)},
                      {"finishedAt", OptionalTime(room.finished_at_ms)},
                      {"matchDuration", room.match_duration_seconds ? nlohmann::json(*room.match_duration_seconds)
                                                                    : nlohmann::json(nullptr)},
                      {"hostReady", room.host_ready},
                      {"opponentReady", room.opponent_ready},
                      {"winnerId", OptionalJson(room.winner_id)},
                      {"outcomeKind", room.outcome_kind ? nlohmann::json(ToString(*room.outcome_kind))
                                                        : nlohmann::json(nullptr)},
                      {"submissions", submissions}};
  if (problem) {
    view["problem"] = ProblemSnapshot(*problem, privileged);
    view["timeLimitSeconds"] = MatchTimeLimit(problem->difficulty).count();
  }
  return view;
}

MatchService::MatchService(boost::asio::io_context& io, MatchServiceConfig config, std::shared_ptr<RoomStore> store,
                           std::shared_ptr<ProblemCatalog> catalog, std::shared_ptr<TestRunner> runner,
                           std::shared_ptr<WinnerResolver> resolver, std::shared_ptr<LobbyTimerManager> lobby_timers,
                           std::shared_ptr<NotificationHub> hub, std::shared_ptr<Observability> observability)
    : io_(io),
      config_(config),
      store_(std::move(store)),
      catalog_(std::move(catalog)),
      runner_(std::move(runner)),
      resolver_(std::move(resolver)),
      lobby_timers_(std::move(lobby_timers)),
      hub_(std::move(hub)),
      observability_(std::move(observability)) {}

std::optional<Problem> MatchService::LoadProblem(const std::string& problem_id, std::string& error_code,
                                                 std::string& error_message) {
  auto problem = catalog_->GetProblem(problem_id);
  if (!problem) {
    error_code = "problem_not_found";
    error_message = "문제를 찾을 수 없습니다";
  }
  return problem;
}

std::optional<Room> MatchService::CreateRoom(const std::string& host_id, const std::string& problem_id,
                                             std::string& error_code, std::string& error_message) {
  if (problem_id.empty()) {
    error_code = "bad_request";
    error_message = "problemId가 필요합니다";
    return std::nullopt;
  }
  if (!LoadProblem(problem_id, error_code, error_message)) {
    return std::nullopt;
  }

  Room room;
  room.problem_id = problem_id;
  room.host_id = host_id;
  room.status = RoomStatus::kWaiting;
  room.created_at_ms = NowMs();
  room.lobby_expires_at_ms =
      room.created_at_ms + std::chrono::duration_cast<std::chrono::milliseconds>(config_.lobby_timeout).count();

  bool inserted = false;
  for (int attempt = 0; attempt < kRoomIdAttempts && !inserted; ++attempt) {
    room.room_id = GenerateRoomId();
    inserted = store_->Insert(room);
  }
  if (!inserted) {
    error_code = "room_id_exhausted";
    error_message = "방 코드를 할당하지 못했습니다. 잠시 후 다시 시도하세요";
    return std::nullopt;
  }

  lobby_timers_->Schedule(room.room_id, room.lobby_expires_at_ms);
  hub_->SubscribeUser(host_id, room.room_id);
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "room_created", "방 생성", room.room_id,
                          {{"hostId", host_id}, {"problemId", problem_id}});
  }
  return room;
}

std::optional<JoinedRoom> MatchService::JoinRoom(const std::string& user_id, const std::string& raw_room_id,
                                                 std::string& error_code, std::string& error_message) {
  const std::string room_id = NormalizeRoomId(raw_room_id);
  if (!IsWellFormedRoomId(room_id)) {
    MapStoreError(StoreError::kNotFound, error_code, error_message);
    return std::nullopt;
  }

  auto outcome = store_->JoinAsOpponent(room_id, user_id, NowMs());
  if (outcome.error != StoreError::kNone) {
    if (outcome.expired_now) {
      lobby_timers_->Cancel(room_id);
      if (auto expired = store_->Find(room_id)) {
        hub_->SendEventToUser(expired->host_id, "room-expired", {{"roomId", room_id}});
        hub_->DropRoom(room_id);
      }
    }
    MapStoreError(outcome.error, error_code, error_message);
    return std::nullopt;
  }

  lobby_timers_->Cancel(room_id);
  hub_->SubscribeUser(user_id, room_id);
  hub_->BroadcastToRoom(room_id, "player-joined",
                        {{"roomId", room_id}, {"opponentId", user_id}, {"status", ToString(RoomStatus::kStarting)}});
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "room_joined", "상대 참가", room_id, {{"opponentId", user_id}});
  }

  auto problem = LoadProblem(outcome.room->problem_id, error_code, error_message);
  if (!problem) {
    return std::nullopt;
  }
  return JoinedRoom{std::move(*outcome.room), std::move(*problem)};
}

std::optional<ReadyOutcome> MatchService::SetReady(const std::string& user_id, const std::string& room_id,
                                                   std::string& error_code, std::string& error_message) {
  auto outcome = store_->MarkReady(room_id, user_id);
  if (outcome.error != StoreError::kNone) {
    MapStoreError(outcome.error, error_code, error_message);
    return std::nullopt;
  }
  if (outcome.changed) {
    hub_->BroadcastToRoom(room_id, "player-ready",
                          {{"roomId", room_id},
                           {"userId", user_id},
                           {"hostReady", outcome.host_ready},
                           {"opponentReady", outcome.opponent_ready}});
    if (outcome.BothReady()) {
      StartCountdown(room_id);
    }
  }
  return outcome;
}

void MatchService::StartCountdown(const std::string& room_id) {
  auto timer = std::make_shared<boost::asio::steady_timer>(io_);
  std::weak_ptr<MatchService> weak = shared_from_this();
  const int from = config_.countdown_from;
  boost::asio::post(io_, [weak, room_id, timer, from]() {
    if (auto self = weak.lock()) {
      self->CountdownStep(room_id, timer, from);
    }
  });
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "countdown_started", "카운트다운 시작", room_id);
  }
}

void MatchService::CountdownStep(const std::string& room_id, const std::shared_ptr<boost::asio::steady_timer>& timer,
                                 int remaining) {
  if (remaining <= 0) {
    CompleteCountdown(room_id);
    return;
  }
  hub_->BroadcastToRoom(room_id, "match-countdown", {{"roomId", room_id}, {"count", remaining}});
  timer->expires_after(config_.countdown_tick);
  std::weak_ptr<MatchService> weak = shared_from_this();
  timer->async_wait([weak, room_id, timer, remaining](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->CountdownStep(room_id, timer, remaining - 1);
    }
  });
}

void MatchService::CompleteCountdown(const std::string& room_id) {
  try {
    const auto started_at = NowMs();
    if (!store_->StartMatch(room_id, started_at)) {
      if (observability_) {
        observability_->Event(LogLevel::kWarn, "match_start_skipped", "시작 조건이 맞지 않음", room_id);
      }
      return;
    }
    nlohmann::json payload{{"roomId", room_id}, {"startedAt", ToIsoString(started_at)}};
    if (auto room = store_->Find(room_id)) {
      payload["problemId"] = room->problem_id;
      if (auto problem = catalog_->GetProblem(room->problem_id)) {
        payload["timeLimitSeconds"] = MatchTimeLimit(problem->difficulty).count();
      }
    }
    hub_->BroadcastToRoom(room_id, "match-started", payload);
    if (observability_) {
      observability_->Event(LogLevel::kInfo, "match_started", "대결 시작", room_id);
    }
  } catch (const DbException& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "match_start_failed", ex.what(), room_id,
                            {{"dbCode", ex.code}, {"retryable", ex.retryable}});
    }
  }
}

std::optional<SubmitOutcome> MatchService::Submit(const std::string& user_id, const std::string& room_id,
                                                  const std::string& code, const std::string& language,
                                                  std::string& error_code, std::string& error_message) {
  auto parsed_language = ParseLanguage(language);
  if (!parsed_language) {
    error_code = "unsupported_language";
    error_message = "지원하지 않는 언어입니다: " + language;
    return std::nullopt;
  }
  if (code.empty()) {
    error_code = "bad_request";
    error_message = "code가 비어 있습니다";
    return std::nullopt;
  }

  auto room = store_->Find(room_id);
  if (!room) {
    MapStoreError(StoreError::kNotFound, error_code, error_message);
    return std::nullopt;
  }
  if (!room->IsParticipant(user_id)) {
    MapStoreError(StoreError::kNotParticipant, error_code, error_message);
    return std::nullopt;
  }
  if (room->winner_id) {
    error_code = "match_already_won";
    error_message = "이미 승자가 결정된 대결입니다";
    return std::nullopt;
  }
  if (room->status != RoomStatus::kInProgress) {
    error_code = "match_not_in_progress";
    error_message = "진행 중인 대결이 아닙니다";
    return std::nullopt;
  }

  auto problem = LoadProblem(room->problem_id, error_code, error_message);
  if (!problem) {
    return std::nullopt;
  }
  if (!problem->AllowsLanguage(*parsed_language)) {
    error_code = "language_not_allowed";
    error_message = "이 문제에서 허용되지 않는 언어입니다";
    return std::nullopt;
  }

  if (observability_) {
    observability_->IncrementSubmission();
  }
  hub_->BroadcastToRoom(room_id, "opponent-submitted", {{"roomId", room_id}, {"userId", user_id}}, user_id);

  auto cases = TestRunner::Arrange(problem->sample_cases, problem->hidden_cases);
  auto report = runner_->Run(*parsed_language, code, cases,
                             CaseTimeLimitMs(*problem, *parsed_language, config_.default_time_limit_ms));

  Submission submission;
  submission.user_id = user_id;
  submission.code = code;
  submission.language = *parsed_language;
  submission.result = report.accepted ? SubmissionResult::kAccepted : SubmissionResult::kRejected;
  submission.test_results = report.verdicts;
  submission.submitted_at_ms = NowMs();
  // 채점 중 방이 끝났어도 감사 기록으로 남긴다. 결과는 바뀌지 않는다.
  store_->AppendSubmission(room_id, submission);

  if (report.accepted) {
    resolver_->ResolveAccepted(*room, user_id, problem->difficulty, NowMs());
  } else {
    // 판정 직후 상대 제출이 끼어들면 종료 기록이 거부되므로 다시 읽어 판정한다.
    for (int attempt = 0; attempt < kScoreResolveAttempts; ++attempt) {
      auto fresh = store_->Find(room_id);
      if (!fresh || fresh->status != RoomStatus::kInProgress || !fresh->BothSubmitted()) {
        break;
      }
      if (resolver_->ResolveByScore(*fresh, ResolutionTrigger::kBothSubmitted, problem->difficulty, NowMs())) {
        break;
      }
    }
  }

  SubmitOutcome outcome;
  outcome.result = submission.result;
  outcome.verdicts = std::move(report.verdicts);
  outcome.passed_count = report.passed_count;
  outcome.total_count = report.total_count;
  if (auto final_room = store_->Find(room_id)) {
    outcome.match_finished = final_room->status == RoomStatus::kFinished;
    outcome.is_winner = final_room->winner_id && *final_room->winner_id == user_id;
  }
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "submission_graded", "제출 채점 완료", room_id,
                          {{"userId", user_id},
                           {"language", ToString(*parsed_language)},
                           {"result", ToString(outcome.result)},
                           {"passed", outcome.passed_count},
                           {"total", outcome.total_count},
                           {"maxTimeMs", report.max_time_ms}});
  }
  return outcome;
}

std::optional<nlohmann::json> MatchService::GetRoomView(const std::string& room_id, bool privileged,
                                                        std::string& error_code, std::string& error_message) {
  auto room = store_->Find(NormalizeRoomId(room_id));
  if (!room) {
    MapStoreError(StoreError::kNotFound, error_code, error_message);
    return std::nullopt;
  }
  return RoomToJson(*room, catalog_->GetProblem(room->problem_id), privileged);
}

std::optional<PracticeOutcome> MatchService::RunPractice(const std::string& problem_id, const std::string& code,
                                                         const std::string& language, std::string& error_code,
                                                         std::string& error_message) {
  auto parsed_language = ParseLanguage(language);
  if (!parsed_language) {
    error_code = "unsupported_language";
    error_message = "지원하지 않는 언어입니다: " + language;
    return std::nullopt;
  }
  auto problem = LoadProblem(problem_id, error_code, error_message);
  if (!problem) {
    return std::nullopt;
  }
  if (!problem->AllowsLanguage(*parsed_language)) {
    error_code = "language_not_allowed";
    error_message = "이 문제에서 허용되지 않는 언어입니다";
    return std::nullopt;
  }
  PracticeOutcome outcome;
  outcome.report = runner_->Run(*parsed_language, code, TestRunner::Arrange(problem->sample_cases, problem->hidden_cases),
                                CaseTimeLimitMs(*problem, *parsed_language, config_.default_time_limit_ms));
  if (outcome.report.total_count > 0) {
    outcome.score = static_cast<int>(outcome.report.passed_count * 100 / outcome.report.total_count);
  }
  return outcome;
}

bool MatchService::CanSubscribe(const std::string& user_id, const std::string& room_id, std::string& error_code,
                                std::string& error_message) {
  auto room = store_->Find(room_id);
  if (!room) {
    MapStoreError(StoreError::kNotFound, error_code, error_message);
    return false;
  }
  if (room->IsParticipant(user_id)) {
    return true;
  }
  if (room->status == RoomStatus::kWaiting) {
    error_code = "spectate_unavailable";
    error_message = "로비 단계의 방은 관전할 수 없습니다";
    return false;
  }
  return true;
}

void MatchService::ExpireRoom(const std::string& room_id) {
  try {
    if (!store_->ExpireIfWaiting(room_id)) {
      return;
    }
    if (auto room = store_->Find(room_id)) {
      hub_->SendEventToUser(room->host_id, "room-expired", {{"roomId", room_id}});
    }
    hub_->DropRoom(room_id);
    if (observability_) {
      observability_->Event(LogLevel::kInfo, "room_expired", "로비 만료", room_id);
    }
  } catch (const DbException& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "room_expire_failed", ex.what(), room_id,
                            {{"dbCode", ex.code}, {"retryable", ex.retryable}});
    }
    if (ex.retryable) {
      lobby_timers_->Schedule(room_id, NowMs() + kExpireRetryDelayMs);
    }
  }
}

std::uint64_t MatchService::ActiveRooms() { return store_->CountActive(); }

}  // namespace arena
