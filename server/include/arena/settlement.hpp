/*
 * 설명: 대결 종료 정산 이벤트와 이를 외부 보상 원장으로 넘기는 싱크를 정의한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/winner_resolution_test.cpp, server/tests/it/room_repository_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "arena/db_client.hpp"
#include "arena/observability.hpp"
#include "arena/room.hpp"

namespace arena {

// 무승부는 winner_id가 비어 있고 outcome_kind가 timeout이다. 보상 정책은 원장이 정한다.
struct SettlementEvent {
  std::string room_id;
  std::optional<std::string> winner_id;
  OutcomeKind outcome_kind{OutcomeKind::kFull};
  std::int64_t match_duration_seconds{0};
  Difficulty difficulty{Difficulty::kUnknown};
};

nlohmann::json ToJson(const SettlementEvent& event);

class SettlementSink {
 public:
  virtual ~SettlementSink() = default;
  // 같은 방에 대해 두 번 이상 받아도 최초 1회만 기록한다. 새로 기록했으면 true.
  virtual bool Emit(const SettlementEvent& event) = 0;
};

// match_settlements 아웃박스 테이블. room_id 기본키가 중복 정산을 막는다.
class MariaDbSettlementOutbox : public SettlementSink {
 public:
  MariaDbSettlementOutbox(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability);
  bool Emit(const SettlementEvent& event) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Observability> observability_;
};

// 메모리 백엔드용. 이벤트를 보관하고 로그로 남긴다.
class LoggingSettlementSink : public SettlementSink {
 public:
  explicit LoggingSettlementSink(std::shared_ptr<Observability> observability);
  bool Emit(const SettlementEvent& event) override;
  std::vector<SettlementEvent> Events() const;

 private:
  std::shared_ptr<Observability> observability_;
  mutable std::mutex mutex_;
  std::vector<SettlementEvent> events_;
};

}  // namespace arena
