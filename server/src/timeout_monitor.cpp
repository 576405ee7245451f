/*
 * 설명: 대결 시간 초과 주기 점검을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/winner_resolution_test.cpp
 */
#include "arena/timeout_monitor.hpp"

#include <unordered_map>

namespace arena {

MatchTimeoutMonitor::MatchTimeoutMonitor(boost::asio::io_context& io, std::shared_ptr<RoomStore> store,
                                         std::shared_ptr<ProblemCatalog> catalog,
                                         std::shared_ptr<WinnerResolver> resolver, std::chrono::seconds interval,
                                         std::shared_ptr<Observability> observability)
    : timer_(io),
      store_(std::move(store)),
      catalog_(std::move(catalog)),
      resolver_(std::move(resolver)),
      interval_(interval),
      observability_(std::move(observability)) {}

void MatchTimeoutMonitor::Start() {
  stopped_ = false;
  ScheduleNext();
}

void MatchTimeoutMonitor::Stop() {
  stopped_ = true;
  timer_.cancel();
}

void MatchTimeoutMonitor::ScheduleNext() {
  if (stopped_) {
    return;
  }
  timer_.expires_after(interval_);
  std::weak_ptr<MatchTimeoutMonitor> weak = shared_from_this();
  timer_.async_wait([weak](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    auto self = weak.lock();
    if (!self || self->stopped_) {
      return;
    }
    try {
      self->SweepOnce(NowMs());
    } catch (const DbException& ex) {
      // 다음 주기에 다시 시도한다.
      if (self->observability_) {
        self->observability_->Event(LogLevel::kError, "timeout_sweep_failed", ex.what(), std::nullopt,
                                    {{"dbCode", ex.code}, {"retryable", ex.retryable}});
      }
    }
    self->ScheduleNext();
  });
}

std::size_t MatchTimeoutMonitor::SweepOnce(std::int64_t now_ms) {
  std::size_t resolved = 0;
  std::unordered_map<std::string, Difficulty> difficulty_cache;
  for (const auto& room : store_->ListByStatus(RoomStatus::kInProgress)) {
    if (room.winner_id || !room.started_at_ms) {
      continue;
    }
    auto cached = difficulty_cache.find(room.problem_id);
    if (cached == difficulty_cache.end()) {
      auto problem = catalog_->GetProblem(room.problem_id);
      cached = difficulty_cache.emplace(room.problem_id, problem ? problem->difficulty : Difficulty::kUnknown).first;
    }
    const Difficulty difficulty = cached->second;
    const auto limit_ms = std::chrono::duration_cast<std::chrono::milliseconds>(MatchTimeLimit(difficulty)).count();
    const bool expired = now_ms - *room.started_at_ms >= limit_ms;
    if (expired) {
      if (resolver_->ResolveByScore(room, ResolutionTrigger::kTimeout, difficulty, now_ms)) {
        ++resolved;
      }
    } else if (room.BothSubmitted()) {
      if (resolver_->ResolveByScore(room, ResolutionTrigger::kBothSubmitted, difficulty, now_ms)) {
        ++resolved;
      }
    }
  }
  if (resolved > 0 && observability_) {
    observability_->Event(LogLevel::kInfo, "timeout_sweep", "시간 초과 점검 완료", std::nullopt,
                          {{"resolved", resolved}});
  }
  return resolved;
}

}  // namespace arena
