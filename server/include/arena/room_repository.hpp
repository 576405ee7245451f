/*
 * 설명: MariaDB 기반 방 저장소. 상태 전이는 트랜잭션 하나 안의 조건부 UPDATE로 수행한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_repository_it_test.cpp
 */
#pragma once

#include <memory>

#include "arena/db_client.hpp"
#include "arena/room_store.hpp"

namespace arena {

class RoomRepository : public RoomStore {
 public:
  explicit RoomRepository(std::shared_ptr<MariaDbClient> db_client);

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

  // 통합 테스트 전용.
  void ClearAll() const;

 private:
  std::optional<Room> LoadRoom(MYSQL* conn, const std::string& room_id, bool for_update) const;
  void LoadSubmissions(MYSQL* conn, Room& room) const;
  Room BuildRoom(const DbRow& row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace arena
