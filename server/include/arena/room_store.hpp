/*
 * 설명: 대결 방 상태의 단일 진실 공급원 인터페이스. 모든 상태 전이는 조건부 쓰기로만 일어난다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_state_test.cpp, server/tests/it/room_repository_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "arena/room.hpp"

namespace arena {

enum class StoreError {
  kNone,
  kNotFound,
  kExpired,
  kFull,
  kSelfJoin,
  kNotJoinable,
  kNotParticipant,
  kNotStarting,
};

struct JoinOutcome {
  StoreError error{StoreError::kNone};
  std::optional<Room> room;
  // 이번 호출이 만료 시각이 지난 방을 expired로 옮겼는지.
  bool expired_now{false};
};

struct ReadyOutcome {
  StoreError error{StoreError::kNone};
  bool host_ready{false};
  bool opponent_ready{false};
  // 이번 호출로 준비 플래그가 실제로 바뀌었는지. 카운트다운은 바뀐 호출 하나만 시작한다.
  bool changed{false};

  bool BothReady() const { return host_ready && opponent_ready; }
};

struct FinishRecord {
  std::optional<std::string> winner_id;
  OutcomeKind outcome_kind{OutcomeKind::kFull};
  std::int64_t finished_at_ms{0};
  std::int64_t match_duration_seconds{0};
  // 점수 판정이 본 제출 수. 설정되면 저장소의 제출 수가 같을 때만 종료한다.
  std::optional<std::size_t> expected_submissions;
};

class RoomStore {
 public:
  virtual ~RoomStore() = default;

  // room_id 중복이면 false.
  virtual bool Insert(const Room& room) = 0;
  virtual std::optional<Room> Find(const std::string& room_id) = 0;

  // waiting 상태이고 만료 전일 때만 상대를 채우고 starting으로 옮긴다.
  // 만료 시각이 지난 waiting 방은 이 호출에서 expired로 옮기고 kExpired를 돌려준다.
  virtual JoinOutcome JoinAsOpponent(const std::string& room_id, const std::string& user_id, std::int64_t now_ms) = 0;
  virtual bool ExpireIfWaiting(const std::string& room_id) = 0;
  virtual ReadyOutcome MarkReady(const std::string& room_id, const std::string& user_id) = 0;
  virtual bool StartMatch(const std::string& room_id, std::int64_t started_at_ms) = 0;
  // 상태와 무관하게 제출 기록을 남긴다. 방이 없으면 false.
  virtual bool AppendSubmission(const std::string& room_id, const Submission& submission) = 0;
  // status='in_progress' AND winner 미설정일 때만 종료한다. 두 번째 호출자는 false를 받는다.
  // expected_submissions가 있으면 그 사이 제출이 추가된 경우에도 false.
  virtual bool FinishRoom(const std::string& room_id, const FinishRecord& record) = 0;

  virtual std::vector<Room> ListByStatus(RoomStatus status) = 0;
  virtual std::uint64_t CountActive() = 0;
};

}  // namespace arena
