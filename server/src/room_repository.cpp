/*
 * 설명: challenge_rooms / room_submissions 테이블에 대한 조건부 전이와 조회를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_repository_it_test.cpp
 */
#include "arena/room_repository.hpp"

#include <sstream>

namespace arena {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;
constexpr const char* kRoomColumns =
    "room_id, problem_id, host_id, opponent_id, status, created_at_ms, lobby_expires_at_ms, started_at_ms, "
    "finished_at_ms, match_duration_seconds, host_ready, opponent_ready, winner_id, outcome_kind";

std::optional<std::int64_t> OptionalInt(const DbRow& row, std::size_t i) {
  if (row.IsNull(i)) {
    return std::nullopt;
  }
  return std::stoll(row.At(i));
}

std::optional<std::string> OptionalText(const DbRow& row, std::size_t i) {
  if (row.IsNull(i)) {
    return std::nullopt;
  }
  return row.At(i);
}
}  // namespace

RoomRepository::RoomRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

bool RoomRepository::Insert(const Room& room) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO challenge_rooms(room_id, problem_id, host_id, status, created_at_ms, lobby_expires_at_ms, "
           "host_ready, opponent_ready) VALUES("
        << db_client_->Quote(conn, room.room_id) << ", " << db_client_->Quote(conn, room.problem_id) << ", "
        << db_client_->Quote(conn, room.host_id) << ", '" << ToString(room.status) << "', " << room.created_at_ms
        << ", " << room.lobby_expires_at_ms << ", 0, 0);";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      if (mysql_errno(conn) == kDuplicateEntry) {
        return false;
      }
      db_client_->RaiseError(conn, "방 생성 실패");
    }
    return true;
  });
}

std::optional<Room> RoomRepository::Find(const std::string& room_id) {
  std::optional<Room> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result = LoadRoom(conn, room_id, false);
    if (result) {
      LoadSubmissions(conn, *result);
    }
  });
  return result;
}

JoinOutcome RoomRepository::JoinAsOpponent(const std::string& room_id, const std::string& user_id,
                                           std::int64_t now_ms) {
  JoinOutcome outcome;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    outcome = JoinOutcome{};
    auto room = LoadRoom(conn, room_id, true);
    if (!room) {
      outcome.error = StoreError::kNotFound;
      return false;
    }
    if (room->status == RoomStatus::kExpired) {
      outcome.error = StoreError::kExpired;
      return false;
    }
    if (room->status != RoomStatus::kWaiting) {
      outcome.error = room->IsFull() ? StoreError::kFull : StoreError::kNotJoinable;
      return false;
    }
    if (room->IsHost(user_id)) {
      outcome.error = StoreError::kSelfJoin;
      return false;
    }
    if (room->IsFull()) {
      outcome.error = StoreError::kFull;
      return false;
    }
    std::ostringstream oss;
    if (now_ms >= room->lobby_expires_at_ms) {
      oss << "UPDATE challenge_rooms SET status='expired' WHERE room_id=" << db_client_->Quote(conn, room_id)
          << " AND status='waiting';";
      outcome.expired_now = db_client_->Execute(conn, oss.str(), "방 만료 처리 실패") > 0;
      outcome.error = StoreError::kExpired;
      return true;
    }
    oss << "UPDATE challenge_rooms SET opponent_id=" << db_client_->Quote(conn, user_id)
        << ", status='starting' WHERE room_id=" << db_client_->Quote(conn, room_id)
        << " AND status='waiting' AND opponent_id IS NULL;";
    if (db_client_->Execute(conn, oss.str(), "방 참가 실패") == 0) {
      outcome.error = StoreError::kNotJoinable;
      return false;
    }
    room->opponent_id = user_id;
    room->status = RoomStatus::kStarting;
    outcome.room = std::move(room);
    return true;
  });
  return outcome;
}

bool RoomRepository::ExpireIfWaiting(const std::string& room_id) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE challenge_rooms SET status='expired' WHERE room_id=" << db_client_->Quote(conn, room_id)
        << " AND status='waiting';";
    return db_client_->Execute(conn, oss.str(), "방 만료 처리 실패") > 0;
  });
}

ReadyOutcome RoomRepository::MarkReady(const std::string& room_id, const std::string& user_id) {
  ReadyOutcome outcome;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    outcome = ReadyOutcome{};
    auto room = LoadRoom(conn, room_id, true);
    if (!room) {
      outcome.error = StoreError::kNotFound;
      return false;
    }
    if (!room->IsParticipant(user_id)) {
      outcome.error = StoreError::kNotParticipant;
      return false;
    }
    if (room->status != RoomStatus::kStarting) {
      outcome.error = StoreError::kNotStarting;
      return false;
    }
    const bool is_host = room->IsHost(user_id);
    const char* column = is_host ? "host_ready" : "opponent_ready";
    std::ostringstream oss;
    oss << "UPDATE challenge_rooms SET " << column << "=1 WHERE room_id=" << db_client_->Quote(conn, room_id)
        << " AND status='starting' AND " << column << "=0;";
    outcome.changed = db_client_->Execute(conn, oss.str(), "준비 상태 갱신 실패") > 0;
    outcome.host_ready = is_host ? true : room->host_ready;
    outcome.opponent_ready = is_host ? room->opponent_ready : true;
    return true;
  });
  return outcome;
}

bool RoomRepository::StartMatch(const std::string& room_id, std::int64_t started_at_ms) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE challenge_rooms SET status='in_progress', started_at_ms=" << started_at_ms
        << " WHERE room_id=" << db_client_->Quote(conn, room_id)
        << " AND status='starting' AND host_ready=1 AND opponent_ready=1;";
    return db_client_->Execute(conn, oss.str(), "대결 시작 실패") > 0;
  });
}

bool RoomRepository::AppendSubmission(const std::string& room_id, const Submission& submission) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream exists;
    exists << "SELECT 1 FROM challenge_rooms WHERE room_id=" << db_client_->Quote(conn, room_id) << " FOR UPDATE;";
    if (db_client_->Query(conn, exists.str(), "방 확인 실패").empty()) {
      return false;
    }
    std::ostringstream oss;
    oss << "INSERT INTO room_submissions(room_id, user_id, language, code, result, test_results, submitted_at_ms) "
           "VALUES("
        << db_client_->Quote(conn, room_id) << ", " << db_client_->Quote(conn, submission.user_id) << ", '"
        << ToString(submission.language) << "', " << db_client_->Quote(conn, submission.code) << ", '"
        << ToString(submission.result) << "', " << db_client_->Quote(conn, VerdictsToJson(submission.test_results).dump())
        << ", " << submission.submitted_at_ms << ");";
    db_client_->Execute(conn, oss.str(), "제출 기록 실패");
    return true;
  });
}

bool RoomRepository::FinishRoom(const std::string& room_id, const FinishRecord& record) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    if (record.expected_submissions) {
      // 방 행을 잠가 AppendSubmission과 직렬화한 뒤 판정 이후 추가된 제출이 없는지 본다.
      if (!LoadRoom(conn, room_id, true)) {
        return false;
      }
      std::ostringstream count;
      count << "SELECT COUNT(*) FROM room_submissions WHERE room_id=" << db_client_->Quote(conn, room_id) << ";";
      auto rows = db_client_->Query(conn, count.str(), "제출 수 조회 실패");
      if (rows.empty() || rows.front().IsNull(0) || std::stoull(rows.front().At(0)) != *record.expected_submissions) {
        return false;
      }
    }
    std::ostringstream oss;
    oss << "UPDATE challenge_rooms SET status='finished', winner_id="
        << (record.winner_id ? db_client_->Quote(conn, *record.winner_id) : std::string("NULL"))
        << ", outcome_kind='" << ToString(record.outcome_kind) << "', finished_at_ms=" << record.finished_at_ms
        << ", match_duration_seconds=" << record.match_duration_seconds
        << " WHERE room_id=" << db_client_->Quote(conn, room_id) << " AND status='in_progress' AND winner_id IS NULL";
    if (record.winner_id) {
      oss << " AND (host_id=" << db_client_->Quote(conn, *record.winner_id)
          << " OR opponent_id=" << db_client_->Quote(conn, *record.winner_id) << ")";
    }
    oss << ";";
    return db_client_->Execute(conn, oss.str(), "대결 종료 기록 실패") > 0;
  });
}

std::vector<Room> RoomRepository::ListByStatus(RoomStatus status) {
  std::vector<Room> rooms;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    rooms.clear();
    std::ostringstream oss;
    oss << "SELECT " << kRoomColumns << " FROM challenge_rooms WHERE status='" << ToString(status)
        << "' ORDER BY created_at_ms ASC;";
    for (const auto& row : db_client_->Query(conn, oss.str(), "방 목록 조회 실패")) {
      Room room = BuildRoom(row);
      LoadSubmissions(conn, room);
      rooms.push_back(std::move(room));
    }
  });
  return rooms;
}

std::uint64_t RoomRepository::CountActive() {
  std::uint64_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto rows = db_client_->Query(
        conn, "SELECT COUNT(*) FROM challenge_rooms WHERE status IN ('waiting','starting','in_progress');",
        "활성 방 카운트 실패");
    if (!rows.empty() && !rows.front().IsNull(0)) {
      count = std::stoull(rows.front().At(0));
    }
  });
  return count;
}

void RoomRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM room_submissions;", "제출 정리 실패");
    db_client_->Execute(conn, "DELETE FROM match_settlements;", "정산 정리 실패");
    db_client_->Execute(conn, "DELETE FROM challenge_rooms;", "방 정리 실패");
  });
}

std::optional<Room> RoomRepository::LoadRoom(MYSQL* conn, const std::string& room_id, bool for_update) const {
  std::ostringstream oss;
  oss << "SELECT " << kRoomColumns << " FROM challenge_rooms WHERE room_id=" << db_client_->Quote(conn, room_id)
      << (for_update ? " FOR UPDATE;" : ";");
  auto rows = db_client_->Query(conn, oss.str(), "방 조회 실패");
  if (rows.empty()) {
    return std::nullopt;
  }
  return BuildRoom(rows.front());
}

void RoomRepository::LoadSubmissions(MYSQL* conn, Room& room) const {
  std::ostringstream oss;
  oss << "SELECT user_id, language, code, result, test_results, submitted_at_ms FROM room_submissions WHERE room_id="
      << db_client_->Quote(conn, room.room_id) << " ORDER BY submission_id ASC;";
  room.submissions.clear();
  for (const auto& row : db_client_->Query(conn, oss.str(), "제출 조회 실패")) {
    Submission submission;
    submission.user_id = row.At(0);
    submission.language = ParseLanguage(row.At(1)).value_or(Language::kPython);
    submission.code = row.At(2);
    submission.result = ParseSubmissionResult(row.At(3)).value_or(SubmissionResult::kRejected);
    if (!row.IsNull(4)) {
      auto parsed = nlohmann::json::parse(row.At(4), nullptr, false);
      if (!parsed.is_discarded()) {
        submission.test_results = VerdictsFromJson(parsed);
      }
    }
    submission.submitted_at_ms = std::stoll(row.At(5));
    room.submissions.push_back(std::move(submission));
  }
}

Room RoomRepository::BuildRoom(const DbRow& row) const {
  Room room;
  room.room_id = row.At(0);
  room.problem_id = row.At(1);
  room.host_id = row.At(2);
  room.opponent_id = OptionalText(row, 3);
  room.status = ParseRoomStatus(row.At(4)).value_or(RoomStatus::kExpired);
  room.created_at_ms = std::stoll(row.At(5));
  room.lobby_expires_at_ms = std::stoll(row.At(6));
  room.started_at_ms = OptionalInt(row, 7);
  room.finished_at_ms = OptionalInt(row, 8);
  room.match_duration_seconds = OptionalInt(row, 9);
  room.host_ready = row.At(10) == "1";
  room.opponent_ready = row.At(11) == "1";
  room.winner_id = OptionalText(row, 12);
  if (!row.IsNull(13)) {
    room.outcome_kind = ParseOutcomeKind(row.At(13));
  }
  return room;
}

}  // namespace arena
