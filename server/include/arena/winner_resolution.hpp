/*
 * 설명: 승자 결정 엔진. 최초 완전 정답, 또는 숨김 케이스 최고 통과 수 비교, 또는 무승부로 방을 종료한다.
 *       모든 종료 쓰기는 저장소의 조건부 쓰기이며 진 쪽 호출은 아무것도 바꾸지 않는다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/winner_resolution_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "arena/observability.hpp"
#include "arena/realtime.hpp"
#include "arena/room.hpp"
#include "arena/room_store.hpp"
#include "arena/settlement.hpp"

namespace arena {

enum class ResolutionTrigger { kTimeout, kBothSubmitted };

struct ScoreDecision {
  std::optional<std::string> winner_id;
  OutcomeKind outcome_kind{OutcomeKind::kTimeout};
  std::size_t host_best{0};
  std::size_t opponent_best{0};
};

// 참가자별 최고 숨김 케이스 통과 수를 비교한다. 같으면(0 포함) 무승부.
ScoreDecision DecideByScore(const Room& room);

class WinnerResolver {
 public:
  WinnerResolver(std::shared_ptr<RoomStore> store, std::shared_ptr<SettlementSink> settlement,
                 std::shared_ptr<NotificationHub> hub, std::shared_ptr<Observability> observability);

  // 완전 정답 제출자를 승자로 기록한다. 이번 호출이 방을 종료시켰으면 true.
  bool ResolveAccepted(const Room& room, const std::string& winner_id, Difficulty difficulty, std::int64_t now_ms);
  bool ResolveByScore(const Room& room, ResolutionTrigger trigger, Difficulty difficulty, std::int64_t now_ms);

 private:
  bool Commit(const Room& room, const FinishRecord& record, Difficulty difficulty);

  std::shared_ptr<RoomStore> store_;
  std::shared_ptr<SettlementSink> settlement_;
  std::shared_ptr<NotificationHub> hub_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace arena
