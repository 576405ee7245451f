/*
 * 설명: HTTP 요청을 처리하고 방 생명주기/제출/연습 실행/운영 엔드포인트와 WS 업그레이드를 분기한다.
 *       채점이 필요한 요청은 실행 워커 풀로 넘기고 응답만 연결의 strand로 되돌린다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#include "arena/http_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "arena/api_response.hpp"
#include "arena/db_client.hpp"

namespace arena {

namespace {
namespace http = boost::beast::http;

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos < path.size()) {
    auto slash = path.find('/', pos);
    if (slash == std::string::npos) {
      slash = path.size();
    }
    if (slash > pos) {
      segments.push_back(path.substr(pos, slash - pos));
    }
    pos = slash + 1;
  }
  return segments;
}

void WriteJson(HttpResponse& res, http::status status, const nlohmann::json& envelope) {
  res.result(status);
  res.body() = envelope.dump();
  res.content_length(res.body().size());
}

void WriteError(HttpResponse& res, const std::string& code, const std::string& message) {
  WriteJson(res, static_cast<http::status>(HttpStatusForError(code)), MakeErrorEnvelope(code, message));
}

void WriteStoreUnavailable(HttpResponse& res) {
  WriteError(res, "store_unavailable", "저장소를 일시적으로 사용할 수 없습니다");
}

// 본문이 JSON 객체이고 지정한 문자열 필드가 모두 있으면 파싱 결과를 돌려준다.
std::optional<nlohmann::json> ParseBody(const std::string& body, std::initializer_list<const char*> required) {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  for (const char* key : required) {
    if (!parsed.contains(key) || !parsed[key].is_string()) {
      return std::nullopt;
    }
  }
  return parsed;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<IdentityVerifier> identity, std::shared_ptr<MatchService> match_service,
                         std::shared_ptr<NotificationHub> hub, std::shared_ptr<boost::asio::thread_pool> execution_pool,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), identity_(std::move(identity)),
      match_service_(std::move(match_service)), hub_(std::move(hub)), execution_pool_(std::move(execution_pool)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<HttpResponse>();
  res->version(req_.version());
  res->set(http::field::server, "arena-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));
  try {
    Route(res, path);
  } catch (const DbException& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "store_unavailable", ex.what(), std::nullopt,
                            {{"dbCode", ex.code}, {"retryable", ex.retryable}, {"path", path}});
    }
    WriteStoreUnavailable(*res);
    SendResponse(res);
  }
}

void HttpSession::Route(const std::shared_ptr<HttpResponse>& res, const std::string& path) {
  const auto segments = SplitPath(path);
  const auto method = req_.method();

  if (method == http::verb::get && path == "/api/health") {
    WriteJson(*res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v2.0.0"}}));
    return SendResponse(res);
  }

  if (method == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(match_service_->ActiveRooms());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"rooms", {{"active", snapshot.active_rooms}}},
                        {"submissions", {{"total", snapshot.submissions_total}}},
                        {"executions", {{"total", snapshot.executions_total}}},
                        {"sandbox", {{"cleanupFailures", snapshot.cleanup_failures}}}};
    WriteJson(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  if (method == http::verb::get && path == "/ops/status") {
    if (!HasOpsToken()) {
      WriteError(*res, "unauthorized", "운영 토큰이 올바르지 않습니다");
      return SendResponse(res);
    }
    auto snapshot = observability_->Snapshot(match_service_->ActiveRooms());
    nlohmann::json data{{"activeRooms", snapshot.active_rooms},
                        {"activeWebsocket", snapshot.websocket_active},
                        {"errorCount", snapshot.request_errors},
                        {"executions", snapshot.executions_total},
                        {"cleanupFailures", snapshot.cleanup_failures}};
    WriteJson(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  const bool is_api = !segments.empty() && segments[0] == "api";
  if (!is_api) {
    WriteError(*res, "not_found", "지원되지 않는 경로입니다");
    return SendResponse(res);
  }

  auto identity = ExtractIdentity();
  if (!identity) {
    WriteError(*res, "unauthorized", "인증이 필요합니다");
    return SendResponse(res);
  }
  user_id_ = identity->user_id;
  std::string error_code;
  std::string error_message;

  if (method == http::verb::post && path == "/api/rooms") {
    auto body = ParseBody(req_.body(), {"problemId"});
    if (!body) {
      WriteError(*res, "bad_request", "problemId가 필요합니다");
      return SendResponse(res);
    }
    auto room = match_service_->CreateRoom(identity->user_id, (*body)["problemId"].get<std::string>(), error_code,
                                           error_message);
    if (!room) {
      WriteError(*res, error_code, error_message);
      return SendResponse(res);
    }
    nlohmann::json data{{"roomId", room->room_id},
                        {"problemId", room->problem_id},
                        {"status", ToString(room->status)},
                        {"expiresAt", ToIsoString(room->lobby_expires_at_ms)}};
    WriteJson(*res, http::status::created, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  if (method == http::verb::post && path == "/api/rooms/join") {
    auto body = ParseBody(req_.body(), {"roomId"});
    if (!body) {
      WriteError(*res, "bad_request", "roomId가 필요합니다");
      return SendResponse(res);
    }
    auto joined =
        match_service_->JoinRoom(identity->user_id, (*body)["roomId"].get<std::string>(), error_code, error_message);
    if (!joined) {
      WriteError(*res, error_code, error_message);
      return SendResponse(res);
    }
    nlohmann::json data{{"roomId", joined->room.room_id},
                        {"problemId", joined->room.problem_id},
                        {"problem", ProblemSnapshot(joined->problem, false)},
                        {"status", ToString(joined->room.status)},
                        {"hostId", joined->room.host_id}};
    WriteJson(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  // /api/rooms/{roomId}[/ready|/submit]
  if (segments.size() >= 3 && segments[1] == "rooms") {
    const std::string& room_id = segments[2];
    if (method == http::verb::get && segments.size() == 3) {
      auto view = match_service_->GetRoomView(room_id, HasOpsToken(), error_code, error_message);
      if (!view) {
        WriteError(*res, error_code, error_message);
        return SendResponse(res);
      }
      WriteJson(*res, http::status::ok, MakeSuccessEnvelope(*view));
      return SendResponse(res);
    }
    if (method == http::verb::post && segments.size() == 4 && segments[3] == "ready") {
      auto ready = match_service_->SetReady(identity->user_id, room_id, error_code, error_message);
      if (!ready) {
        WriteError(*res, error_code, error_message);
        return SendResponse(res);
      }
      nlohmann::json data{{"hostReady", ready->host_ready},
                          {"opponentReady", ready->opponent_ready},
                          {"bothReady", ready->BothReady()}};
      WriteJson(*res, http::status::ok, MakeSuccessEnvelope(data));
      return SendResponse(res);
    }
    if (method == http::verb::post && segments.size() == 4 && segments[3] == "submit") {
      return HandleSubmit(res, *identity, room_id);
    }
  }

  // /api/problems/{problemId}/run
  if (method == http::verb::post && segments.size() == 4 && segments[1] == "problems" && segments[3] == "run") {
    return HandlePracticeRun(res, segments[2]);
  }

  WriteError(*res, "not_found", "지원되지 않는 경로입니다");
  SendResponse(res);
}

void HttpSession::HandleSubmit(const std::shared_ptr<HttpResponse>& res, const Identity& identity,
                               const std::string& room_id) {
  auto body = ParseBody(req_.body(), {"code", "language"});
  if (!body) {
    WriteError(*res, "bad_request", "code와 language가 필요합니다");
    return SendResponse(res);
  }
  auto self = shared_from_this();
  auto code = (*body)["code"].get<std::string>();
  auto language = (*body)["language"].get<std::string>();
  boost::asio::post(*execution_pool_, [self, res, user_id = identity.user_id, room_id, code, language]() {
    try {
      std::string error_code;
      std::string error_message;
      auto outcome = self->match_service_->Submit(user_id, room_id, code, language, error_code, error_message);
      if (!outcome) {
        WriteError(*res, error_code, error_message);
      } else {
        nlohmann::json data{{"result", ToString(outcome->result)},
                            {"testResults", RedactedVerdictsToJson(outcome->verdicts)},
                            {"passedCount", outcome->passed_count},
                            {"totalCount", outcome->total_count},
                            {"isWinner", outcome->is_winner},
                            {"matchFinished", outcome->match_finished}};
        WriteJson(*res, http::status::ok, MakeSuccessEnvelope(data));
      }
    } catch (const DbException& ex) {
      if (self->observability_) {
        self->observability_->Event(LogLevel::kError, "store_unavailable", ex.what(), room_id,
                                    {{"dbCode", ex.code}, {"retryable", ex.retryable}});
      }
      WriteStoreUnavailable(*res);
    }
    boost::asio::post(self->stream_.get_executor(), [self, res]() { self->SendResponse(res); });
  });
}

void HttpSession::HandlePracticeRun(const std::shared_ptr<HttpResponse>& res, const std::string& problem_id) {
  auto body = ParseBody(req_.body(), {"code", "language"});
  if (!body) {
    WriteError(*res, "bad_request", "code와 language가 필요합니다");
    return SendResponse(res);
  }
  auto self = shared_from_this();
  auto code = (*body)["code"].get<std::string>();
  auto language = (*body)["language"].get<std::string>();
  boost::asio::post(*execution_pool_, [self, res, problem_id, code, language]() {
    try {
      std::string error_code;
      std::string error_message;
      auto outcome = self->match_service_->RunPractice(problem_id, code, language, error_code, error_message);
      if (!outcome) {
        WriteError(*res, error_code, error_message);
      } else {
        nlohmann::json data{{"accepted", outcome->report.accepted},
                            {"score", outcome->score},
                            {"passedCount", outcome->report.passed_count},
                            {"totalCount", outcome->report.total_count},
                            {"executionTimeMs", outcome->report.max_time_ms},
                            {"testResults", RedactedVerdictsToJson(outcome->report.verdicts)}};
        WriteJson(*res, http::status::ok, MakeSuccessEnvelope(data));
      }
    } catch (const DbException& ex) {
      if (self->observability_) {
        self->observability_->Event(LogLevel::kError, "store_unavailable", ex.what(), std::nullopt,
                                    {{"dbCode", ex.code}, {"problemId", problem_id}});
      }
      WriteStoreUnavailable(*res);
    }
    boost::asio::post(self->stream_.get_executor(), [self, res]() { self->SendResponse(res); });
  });
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.user_id = user_id_;
    ctx.name = std::string(req_.target());
    ctx.latency_ms = static_cast<long>(latency);
    ctx.level = res->result_int() >= 500 ? LogLevel::kError : LogLevel::kInfo;
    ctx.fields = {{"method", std::string(req_.method_string())}, {"status", res->result_int()}};
    observability_->Log(ctx);
  }
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  auto identity = ExtractIdentity();
  if (!identity || std::string(req_.target()).rfind("/ws", 0) != 0) {
    auto res = std::make_shared<HttpResponse>();
    res->version(req_.version());
    res->set(http::field::content_type, "application/json; charset=utf-8");
    request_start_ = std::chrono::steady_clock::now();
    if (!identity) {
      WriteError(*res, "unauthorized", "WS 업그레이드에는 인증이 필요합니다");
    } else {
      WriteError(*res, "not_found", "WS 경로는 /ws 입니다");
    }
    return SendResponse(res);
  }
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(http::field::server, "arena-server");
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    if (observability_) {
      observability_->Event(LogLevel::kWarn, "ws_accept_failed", ec.message(), std::nullopt,
                            {{"userId", identity->user_id}});
    }
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), *identity, hub_, match_service_, observability_,
                                     config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

std::optional<Identity> HttpSession::ExtractIdentity() {
  std::string token;
  auto auth_it = req_.find(http::field::authorization);
  if (auth_it != req_.end()) {
    token = ParseBearer(std::string(auth_it->value()));
  }
  if (token.empty()) {
    // 브라우저 WebSocket은 헤더를 못 붙이므로 ?token= 쿼리도 받는다.
    std::string target = std::string(req_.target());
    auto pos = target.find("token=");
    if (pos != std::string::npos && (pos == 0 || target[pos - 1] == '?' || target[pos - 1] == '&')) {
      token = target.substr(pos + 6, target.find('&', pos) == std::string::npos ? std::string::npos
                                                                                : target.find('&', pos) - pos - 6);
    }
  }
  if (token.empty()) {
    return std::nullopt;
  }
  std::string error_code;
  std::string error_message;
  auto identity = identity_->Verify(token, error_code, error_message);
  if (!identity && observability_) {
    observability_->Event(LogLevel::kDebug, "auth_rejected", error_message);
  }
  return identity;
}

bool HttpSession::HasOpsToken() const {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  return !config_.ops_token.empty() && header_token == config_.ops_token;
}

}  // namespace arena
