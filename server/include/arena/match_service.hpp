/*
 * 설명: 대결 방 생명주기 오케스트레이터. 방 생성/참가/준비/카운트다운/제출/조회와
 *       로비 만료 처리를 저장소, 채점기, 승자 결정 엔진, 알림 허브에 위임해 조율한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_flow_test.cpp, server/tests/unit/room_state_test.cpp,
 *         server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include "arena/lobby_timer.hpp"
#include "arena/observability.hpp"
#include "arena/problem_catalog.hpp"
#include "arena/realtime.hpp"
#include "arena/room.hpp"
#include "arena/room_store.hpp"
#include "arena/test_runner.hpp"
#include "arena/winner_resolution.hpp"

namespace arena {

struct MatchServiceConfig {
  std::chrono::seconds lobby_timeout{300};
  std::chrono::milliseconds countdown_tick{1000};
  int countdown_from{3};
  long default_time_limit_ms{1000};
};

struct JoinedRoom {
  Room room;
  Problem problem;
};

struct SubmitOutcome {
  SubmissionResult result{SubmissionResult::kPending};
  std::vector<TestVerdict> verdicts;
  std::size_t passed_count{0};
  std::size_t total_count{0};
  bool is_winner{false};
  bool match_finished{false};
};

struct PracticeOutcome {
  RunReport report;
  int score{0};
};

class MatchService : public std::enable_shared_from_this<MatchService> {
 public:
  MatchService(boost::asio::io_context& io, MatchServiceConfig config, std::shared_ptr<RoomStore> store,
               std::shared_ptr<ProblemCatalog> catalog, std::shared_ptr<TestRunner> runner,
               std::shared_ptr<WinnerResolver> resolver, std::shared_ptr<LobbyTimerManager> lobby_timers,
               std::shared_ptr<NotificationHub> hub, std::shared_ptr<Observability> observability);

  // 거절 사유는 error_code/error_message로, 저장소 장애는 DbException으로 알린다.
  std::optional<Room> CreateRoom(const std::string& host_id, const std::string& problem_id, std::string& error_code,
                                 std::string& error_message);
  std::optional<JoinedRoom> JoinRoom(const std::string& user_id, const std::string& raw_room_id,
                                     std::string& error_code, std::string& error_message);
  std::optional<ReadyOutcome> SetReady(const std::string& user_id, const std::string& room_id,
                                       std::string& error_code, std::string& error_message);
  // 채점을 포함하므로 실행 워커 스레드에서 호출한다.
  std::optional<SubmitOutcome> Submit(const std::string& user_id, const std::string& room_id, const std::string& code,
                                      const std::string& language, std::string& error_code,
                                      std::string& error_message);
  std::optional<nlohmann::json> GetRoomView(const std::string& room_id, bool privileged, std::string& error_code,
                                            std::string& error_message);
  std::optional<PracticeOutcome> RunPractice(const std::string& problem_id, const std::string& code,
                                             const std::string& language, std::string& error_code,
                                             std::string& error_message);
  // 구독 허용 여부. 참가자는 항상, 관전자는 방이 로비를 떠난 뒤부터.
  bool CanSubscribe(const std::string& user_id, const std::string& room_id, std::string& error_code,
                    std::string& error_message);

  // 로비 타이머 발화 시 호출된다.
  void ExpireRoom(const std::string& room_id);
  std::uint64_t ActiveRooms();

 private:
  void StartCountdown(const std::string& room_id);
  void CountdownStep(const std::string& room_id, const std::shared_ptr<boost::asio::steady_timer>& timer,
                     int remaining);
  void CompleteCountdown(const std::string& room_id);
  std::optional<Problem> LoadProblem(const std::string& problem_id, std::string& error_code,
                                     std::string& error_message);

  boost::asio::io_context& io_;
  MatchServiceConfig config_;
  std::shared_ptr<RoomStore> store_;
  std::shared_ptr<ProblemCatalog> catalog_;
  std::shared_ptr<TestRunner> runner_;
  std::shared_ptr<WinnerResolver> resolver_;
  std::shared_ptr<LobbyTimerManager> lobby_timers_;
  std::shared_ptr<NotificationHub> hub_;
  std::shared_ptr<Observability> observability_;
};

// 숨김 케이스 판정은 통과 여부와 오류 종류만 남기고 출력/상세는 지운다.
nlohmann::json RedactedVerdictsToJson(const std::vector<TestVerdict>& verdicts);
nlohmann::json RoomToJson(const Room& room, const std::optional<Problem>& problem, bool privileged);

}  // namespace arena
