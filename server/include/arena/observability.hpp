/*
 * 설명: 구조화 로그(JSON 라인)와 운영 메트릭 카운터를 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace arena {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);
const char* ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::string> room_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::string message;
  nlohmann::json fields;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t submissions_total{0};
  std::uint64_t executions_total{0};
  std::uint64_t cleanup_failures{0};
  std::uint64_t active_rooms{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementSubmission();
  void IncrementExecution();
  void IncrementCleanupFailure();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t active_rooms) const;

  void Log(const LogContext& ctx) const;
  // 요청 추적이 없는 내부 이벤트(타이머, 샌드박스 정리 등)용 축약형.
  void Event(LogLevel level, const std::string& name, const std::string& message,
             const std::optional<std::string>& room_id = std::nullopt,
             nlohmann::json fields = nullptr) const;

  bool Enabled(LogLevel level) const { return static_cast<int>(level) >= static_cast<int>(min_level_); }

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> submissions_total_{0};
  std::atomic<std::uint64_t> executions_total_{0};
  std::atomic<std::uint64_t> cleanup_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex out_mutex_;
};

}  // namespace arena
