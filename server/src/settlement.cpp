/*
 * 설명: 정산 이벤트 직렬화와 아웃박스/로그 싱크 구현.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/winner_resolution_test.cpp, server/tests/it/room_repository_it_test.cpp
 */
#include "arena/settlement.hpp"

#include <algorithm>
#include <sstream>

namespace arena {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;
}  // namespace

nlohmann::json ToJson(const SettlementEvent& event) {
  return nlohmann::json{{"roomId", event.room_id},
                        {"winnerId", event.winner_id ? nlohmann::json(*event.winner_id) : nlohmann::json(nullptr)},
                        {"outcomeKind", ToString(event.outcome_kind)},
                        {"matchDuration", event.match_duration_seconds},
                        {"difficulty", ToString(event.difficulty)}};
}

MariaDbSettlementOutbox::MariaDbSettlementOutbox(std::shared_ptr<MariaDbClient> db_client,
                                                 std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)), observability_(std::move(observability)) {}

bool MariaDbSettlementOutbox::Emit(const SettlementEvent& event) {
  bool inserted = db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO match_settlements(room_id, winner_id, outcome_kind, match_duration_seconds, difficulty, "
           "created_at_ms) VALUES("
        << db_client_->Quote(conn, event.room_id) << ", "
        << (event.winner_id ? db_client_->Quote(conn, *event.winner_id) : std::string("NULL")) << ", '"
        << ToString(event.outcome_kind) << "', " << event.match_duration_seconds << ", '"
        << ToString(event.difficulty) << "', " << NowMs() << ");";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      if (mysql_errno(conn) == kDuplicateEntry) {
        return false;
      }
      db_client_->RaiseError(conn, "정산 아웃박스 기록 실패");
    }
    return true;
  });
  if (observability_) {
    observability_->Event(inserted ? LogLevel::kInfo : LogLevel::kWarn, "settlement_emitted",
                          inserted ? "정산 이벤트 기록" : "중복 정산 무시", event.room_id, ToJson(event));
  }
  return inserted;
}

LoggingSettlementSink::LoggingSettlementSink(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

bool LoggingSettlementSink::Emit(const SettlementEvent& event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto duplicate = std::any_of(events_.begin(), events_.end(),
                                 [&](const SettlementEvent& existing) { return existing.room_id == event.room_id; });
    if (duplicate) {
      return false;
    }
    events_.push_back(event);
  }
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "settlement_emitted", "정산 이벤트 기록", event.room_id, ToJson(event));
  }
  return true;
}

std::vector<SettlementEvent> LoggingSettlementSink::Events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

}  // namespace arena
