/*
 * 설명: 진행 중인 대결을 주기적으로 훑어 제한 시간이 지났거나 양쪽 모두 제출한 방을 판정한다.
 *       이미 종료된 방은 건너뛰므로 같은 방에 여러 번 돌아도 결과가 같다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/winner_resolution_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "arena/observability.hpp"
#include "arena/problem_catalog.hpp"
#include "arena/room_store.hpp"
#include "arena/winner_resolution.hpp"

namespace arena {

class MatchTimeoutMonitor : public std::enable_shared_from_this<MatchTimeoutMonitor> {
 public:
  MatchTimeoutMonitor(boost::asio::io_context& io, std::shared_ptr<RoomStore> store,
                      std::shared_ptr<ProblemCatalog> catalog, std::shared_ptr<WinnerResolver> resolver,
                      std::chrono::seconds interval, std::shared_ptr<Observability> observability);

  void Start();
  void Stop();
  // 한 번 훑고 이번 호출로 종료시킨 방 수를 돌려준다.
  std::size_t SweepOnce(std::int64_t now_ms);

 private:
  void ScheduleNext();

  boost::asio::steady_timer timer_;
  std::shared_ptr<RoomStore> store_;
  std::shared_ptr<ProblemCatalog> catalog_;
  std::shared_ptr<WinnerResolver> resolver_;
  std::chrono::seconds interval_;
  std::shared_ptr<Observability> observability_;
  bool stopped_{false};
};

}  // namespace arena
