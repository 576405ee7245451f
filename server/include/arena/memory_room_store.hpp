/*
 * 설명: 단일 뮤텍스로 보호되는 인메모리 방 저장소. 테스트와 STORE_BACKEND=memory 실행에 쓴다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_state_test.cpp
 */
#pragma once

#include <mutex>
#include <unordered_map>

#include "arena/room_store.hpp"

namespace arena {

class MemoryRoomStore : public RoomStore {
 public:
  bool Insert(const Room& room) override;
  std::optional<Room> Find(const std::string& room_id) override;
  JoinOutcome JoinAsOpponent(const std::string& room_id, const std::string& user_id, std::int64_t now_ms) override;
  bool ExpireIfWaiting(const std::string& room_id) override;
  ReadyOutcome MarkReady(const std::string& room_id, const std::string& user_id) override;
  bool StartMatch(const std::string& room_id, std::int64_t started_at_ms) override;
  bool AppendSubmission(const std::string& room_id, const Submission& submission) override;
  bool FinishRoom(const std::string& room_id, const FinishRecord& record) override;
  std::vector<Room> ListByStatus(RoomStatus status) override;
  std::uint64_t CountActive() override;

 private:
  std::mutex mutex_;
  std::unordered_map<std::string, Room> rooms_;
};

}  // namespace arena
