/*
 * 설명: 대기 중인 방의 로비 만료 타이머를 방 ID별로 관리한다. 방이 차면 취소되고 종료 시 모두 취소된다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lobby_timer_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "arena/observability.hpp"

namespace arena {

class LobbyTimerManager : public std::enable_shared_from_this<LobbyTimerManager> {
 public:
  using ExpiryHandler = std::function<void(const std::string& room_id)>;

  LobbyTimerManager(boost::asio::io_context& io, std::shared_ptr<Observability> observability);

  void SetHandler(ExpiryHandler handler);
  // 방마다 살아 있는 타이머는 최대 하나. 이미 지난 시각이면 즉시 발화한다.
  void Schedule(const std::string& room_id, std::int64_t due_at_ms);
  bool Cancel(const std::string& room_id);
  void Shutdown();
  std::size_t Pending() const;

 private:
  void OnFire(const std::string& room_id, const std::shared_ptr<boost::asio::steady_timer>& timer);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::shared_ptr<Observability> observability_;
  ExpiryHandler handler_;
  std::unordered_map<std::string, std::shared_ptr<boost::asio::steady_timer>> timers_;
  mutable std::mutex mutex_;
  bool shutdown_{false};
};

}  // namespace arena
