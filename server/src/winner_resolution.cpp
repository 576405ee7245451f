/*
 * 설명: 승자 결정, 종료 기록, 정산 이벤트 발행, match-finished 브로드캐스트를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/winner_resolution_test.cpp
 */
#include "arena/winner_resolution.hpp"

#include <algorithm>

#include "arena/api_response.hpp"
#include "arena/problem_catalog.hpp"

namespace arena {
namespace {
std::size_t BestHiddenPassed(const Room& room, const std::string& user_id) {
  std::size_t best = 0;
  for (const auto& submission : room.submissions) {
    if (submission.user_id == user_id) {
      best = std::max(best, submission.PassedHiddenCount());
    }
  }
  return best;
}

std::int64_t ElapsedSeconds(const Room& room, std::int64_t now_ms) {
  if (!room.started_at_ms) {
    return 0;
  }
  return std::max<std::int64_t>(0, (now_ms - *room.started_at_ms) / 1000);
}
}  // namespace

ScoreDecision DecideByScore(const Room& room) {
  ScoreDecision decision;
  decision.host_best = BestHiddenPassed(room, room.host_id);
  decision.opponent_best = room.opponent_id ? BestHiddenPassed(room, *room.opponent_id) : 0;
  if (decision.host_best > decision.opponent_best) {
    decision.winner_id = room.host_id;
    decision.outcome_kind = OutcomeKind::kPartial;
  } else if (decision.opponent_best > decision.host_best && room.opponent_id) {
    decision.winner_id = *room.opponent_id;
    decision.outcome_kind = OutcomeKind::kPartial;
  } else {
    decision.outcome_kind = OutcomeKind::kTimeout;
  }
  return decision;
}

WinnerResolver::WinnerResolver(std::shared_ptr<RoomStore> store, std::shared_ptr<SettlementSink> settlement,
                               std::shared_ptr<NotificationHub> hub, std::shared_ptr<Observability> observability)
    : store_(std::move(store)),
      settlement_(std::move(settlement)),
      hub_(std::move(hub)),
      observability_(std::move(observability)) {}

bool WinnerResolver::ResolveAccepted(const Room& room, const std::string& winner_id, Difficulty difficulty,
                                     std::int64_t now_ms) {
  FinishRecord record{winner_id, OutcomeKind::kFull, now_ms, ElapsedSeconds(room, now_ms)};
  return Commit(room, record, difficulty);
}

bool WinnerResolver::ResolveByScore(const Room& room, ResolutionTrigger trigger, Difficulty difficulty,
                                    std::int64_t now_ms) {
  auto decision = DecideByScore(room);
  std::int64_t duration = trigger == ResolutionTrigger::kTimeout ? MatchTimeLimit(difficulty).count()
                                                                 : ElapsedSeconds(room, now_ms);
  FinishRecord record{decision.winner_id, decision.outcome_kind, now_ms, duration};
  record.expected_submissions = room.submissions.size();
  return Commit(room, record, difficulty);
}

bool WinnerResolver::Commit(const Room& room, const FinishRecord& record, Difficulty difficulty) {
  if (!store_->FinishRoom(room.room_id, record)) {
    if (observability_) {
      observability_->Event(LogLevel::kDebug, "finish_lost", "이미 종료된 방", room.room_id);
    }
    return false;
  }

  std::optional<std::string> loser_id;
  if (record.winner_id && room.opponent_id) {
    loser_id = room.IsHost(*record.winner_id) ? *room.opponent_id : room.host_id;
  }
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "match_finished", "대결 종료", room.room_id,
                          {{"winnerId", record.winner_id ? nlohmann::json(*record.winner_id) : nlohmann::json(nullptr)},
                           {"outcomeKind", ToString(record.outcome_kind)},
                           {"matchDuration", record.match_duration_seconds}});
  }

  if (settlement_) {
    try {
      settlement_->Emit(SettlementEvent{room.room_id, record.winner_id, record.outcome_kind,
                                        record.match_duration_seconds, difficulty});
    } catch (const DbException& ex) {
      // 방 종료는 이미 커밋되었으므로 정산 실패는 로그로만 남긴다.
      if (observability_) {
        observability_->Event(LogLevel::kError, "settlement_failed", ex.what(), room.room_id);
      }
    }
  }

  if (hub_) {
    nlohmann::json payload{
        {"roomId", room.room_id},
        {"winnerId", record.winner_id ? nlohmann::json(*record.winner_id) : nlohmann::json(nullptr)},
        {"loserId", loser_id ? nlohmann::json(*loser_id) : nlohmann::json(nullptr)},
        {"matchDuration", record.match_duration_seconds},
        {"finishedAt", ToIsoString(record.finished_at_ms)},
        {"outcomeKind", ToString(record.outcome_kind)},
        {"isTie", !record.winner_id.has_value()}};
    hub_->BroadcastToRoom(room.room_id, "match-finished", payload);
    hub_->DropRoom(room.room_id);
  }
  return true;
}

}  // namespace arena
