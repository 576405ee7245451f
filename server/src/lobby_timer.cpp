/*
 * 설명: 로비 만료 타이머 등록/취소/발화를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lobby_timer_test.cpp
 */
#include "arena/lobby_timer.hpp"

#include <algorithm>
#include <chrono>

#include <boost/asio/bind_executor.hpp>

#include "arena/room.hpp"

namespace arena {

LobbyTimerManager::LobbyTimerManager(boost::asio::io_context& io, std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(io)), observability_(std::move(observability)) {}

void LobbyTimerManager::SetHandler(ExpiryHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

void LobbyTimerManager::Schedule(const std::string& room_id, std::int64_t due_at_ms) {
  auto timer = std::make_shared<boost::asio::steady_timer>(strand_);
  auto delay = std::chrono::milliseconds(std::max<std::int64_t>(0, due_at_ms - NowMs()));
  timer->expires_after(delay);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return;
    }
    auto it = timers_.find(room_id);
    if (it != timers_.end()) {
      it->second->cancel();
    }
    timers_[room_id] = timer;
  }
  std::weak_ptr<LobbyTimerManager> weak = shared_from_this();
  timer->async_wait(boost::asio::bind_executor(strand_, [weak, room_id, timer](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (auto self = weak.lock()) {
      self->OnFire(room_id, timer);
    }
  }));
  if (observability_) {
    observability_->Event(LogLevel::kDebug, "lobby_timer_scheduled", "로비 만료 예약", room_id,
                          {{"delayMs", delay.count()}});
  }
}

bool LobbyTimerManager::Cancel(const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = timers_.find(room_id);
  if (it == timers_.end()) {
    return false;
  }
  it->second->cancel();
  timers_.erase(it);
  return true;
}

void LobbyTimerManager::Shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  shutdown_ = true;
  for (auto& [room_id, timer] : timers_) {
    timer->cancel();
  }
  timers_.clear();
}

std::size_t LobbyTimerManager::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

void LobbyTimerManager::OnFire(const std::string& room_id, const std::shared_ptr<boost::asio::steady_timer>& timer) {
  ExpiryHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timers_.find(room_id);
    // 취소 직후 이미 큐에 올라간 완료 핸들러나 교체된 타이머는 무시한다.
    if (it == timers_.end() || it->second != timer) {
      return;
    }
    timers_.erase(it);
    handler = handler_;
  }
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "lobby_timer_fired", "로비 만료 타이머 발화", room_id);
  }
  if (handler) {
    handler(room_id);
  }
}

}  // namespace arena
