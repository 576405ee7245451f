/*
 * 설명: 서버 전체 수명주기를 관리하고 저장소 백엔드, 샌드박스, 매치 서비스, 타이머를 조립한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "arena/config.hpp"
#include "arena/db_client.hpp"
#include "arena/identity.hpp"
#include "arena/lobby_timer.hpp"
#include "arena/match_service.hpp"
#include "arena/observability.hpp"
#include "arena/problem_catalog.hpp"
#include "arena/realtime.hpp"
#include "arena/room_store.hpp"
#include "arena/sandbox.hpp"
#include "arena/settlement.hpp"
#include "arena/test_runner.hpp"
#include "arena/timeout_monitor.hpp"
#include "arena/winner_resolution.hpp"

namespace arena {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<MatchService> GetMatchService() { return match_service_; }
  std::shared_ptr<NotificationHub> GetHub() { return hub_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void BuildStore();
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<NotificationHub> hub_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<RoomStore> store_;
  std::shared_ptr<ProblemCatalog> catalog_;
  std::shared_ptr<SettlementSink> settlement_;
  std::shared_ptr<ExecutionSandbox> sandbox_;
  std::shared_ptr<TestRunner> runner_;
  std::shared_ptr<WinnerResolver> resolver_;
  std::shared_ptr<LobbyTimerManager> lobby_timers_;
  std::shared_ptr<MatchService> match_service_;
  std::shared_ptr<MatchTimeoutMonitor> timeout_monitor_;
  std::shared_ptr<IdentityVerifier> identity_;
  std::shared_ptr<boost::asio::thread_pool> execution_pool_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace arena
