/*
 * 설명: 구조화 로그(JSON 라인)와 운영 메트릭 카운터를 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "arena/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace arena {

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : min_level_(min_level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementSubmission() { submissions_total_.fetch_add(1); }

void Observability::IncrementExecution() { executions_total_.fetch_add(1); }

void Observability::IncrementCleanupFailure() { cleanup_failures_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_rooms) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.submissions_total = submissions_total_.load();
  snapshot.executions_total = executions_total_.load();
  snapshot.cleanup_failures = cleanup_failures_.load();
  snapshot.active_rooms = active_rooms;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["level"] = ToString(ctx.level);
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.room_id) {
    log_json["roomId"] = *ctx.room_id;
  }
  if (!ctx.message.empty()) {
    log_json["message"] = ctx.message;
  }
  if (ctx.fields.is_object() && !ctx.fields.empty()) {
    log_json["fields"] = ctx.fields;
  }
  // 여러 워커 스레드가 동시에 기록하므로 한 줄 단위로 직렬화한다.
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(out_mutex_);
  std::cout << line << std::endl;
}

void Observability::Event(LogLevel level, const std::string& name, const std::string& message,
                          const std::optional<std::string>& room_id, nlohmann::json fields) const {
  LogContext ctx;
  ctx.name = name;
  ctx.level = level;
  ctx.message = message;
  ctx.room_id = room_id;
  ctx.fields = std::move(fields);
  Log(ctx);
}

}  // namespace arena
