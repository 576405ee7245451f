/*
 * 설명: 인메모리 방 저장소의 조건부 상태 전이를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_state_test.cpp
 */
#include "arena/memory_room_store.hpp"

namespace arena {

bool MemoryRoomStore::Insert(const Room& room) {
  std::lock_guard<std::mutex> lock(mutex_);
  return rooms_.emplace(room.room_id, room).second;
}

std::optional<Room> MemoryRoomStore::Find(const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return std::nullopt;
  }
  return it->second;
}

JoinOutcome MemoryRoomStore::JoinAsOpponent(const std::string& room_id, const std::string& user_id,
                                            std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return JoinOutcome{StoreError::kNotFound, std::nullopt};
  }
  Room& room = it->second;
  if (room.status == RoomStatus::kExpired) {
    return JoinOutcome{StoreError::kExpired, std::nullopt};
  }
  if (room.status != RoomStatus::kWaiting) {
    return JoinOutcome{room.IsFull() ? StoreError::kFull : StoreError::kNotJoinable, std::nullopt};
  }
  if (room.IsHost(user_id)) {
    return JoinOutcome{StoreError::kSelfJoin, std::nullopt};
  }
  if (room.IsFull()) {
    return JoinOutcome{StoreError::kFull, std::nullopt};
  }
  if (now_ms >= room.lobby_expires_at_ms) {
    room.status = RoomStatus::kExpired;
    return JoinOutcome{StoreError::kExpired, std::nullopt, true};
  }
  room.opponent_id = user_id;
  room.status = RoomStatus::kStarting;
  return JoinOutcome{StoreError::kNone, room};
}

bool MemoryRoomStore::ExpireIfWaiting(const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  if (it == rooms_.end() || it->second.status != RoomStatus::kWaiting) {
    return false;
  }
  it->second.status = RoomStatus::kExpired;
  return true;
}

ReadyOutcome MemoryRoomStore::MarkReady(const std::string& room_id, const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return ReadyOutcome{StoreError::kNotFound};
  }
  Room& room = it->second;
  if (!room.IsParticipant(user_id)) {
    return ReadyOutcome{StoreError::kNotParticipant};
  }
  if (room.status != RoomStatus::kStarting) {
    return ReadyOutcome{StoreError::kNotStarting};
  }
  bool& flag = room.IsHost(user_id) ? room.host_ready : room.opponent_ready;
  bool changed = !flag;
  flag = true;
  return ReadyOutcome{StoreError::kNone, room.host_ready, room.opponent_ready, changed};
}

bool MemoryRoomStore::StartMatch(const std::string& room_id, std::int64_t started_at_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return false;
  }
  Room& room = it->second;
  if (room.status != RoomStatus::kStarting || !room.BothReady()) {
    return false;
  }
  room.status = RoomStatus::kInProgress;
  room.started_at_ms = started_at_ms;
  return true;
}

bool MemoryRoomStore::AppendSubmission(const std::string& room_id, const Submission& submission) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return false;
  }
  it->second.submissions.push_back(submission);
  return true;
}

bool MemoryRoomStore::FinishRoom(const std::string& room_id, const FinishRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return false;
  }
  Room& room = it->second;
  if (room.status != RoomStatus::kInProgress || room.winner_id) {
    return false;
  }
  if (record.winner_id && !room.IsParticipant(*record.winner_id)) {
    return false;
  }
  if (record.expected_submissions && room.submissions.size() != *record.expected_submissions) {
    return false;
  }
  room.status = RoomStatus::kFinished;
  room.winner_id = record.winner_id;
  room.outcome_kind = record.outcome_kind;
  room.finished_at_ms = record.finished_at_ms;
  room.match_duration_seconds = record.match_duration_seconds;
  return true;
}

std::vector<Room> MemoryRoomStore::ListByStatus(RoomStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Room> result;
  for (const auto& [id, room] : rooms_) {
    if (room.status == status) {
      result.push_back(room);
    }
  }
  return result;
}

std::uint64_t MemoryRoomStore::CountActive() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uint64_t count = 0;
  for (const auto& [id, room] : rooms_) {
    if (!room.IsTerminal()) {
      ++count;
    }
  }
  return count;
}

}  // namespace arena
