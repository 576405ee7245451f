/*
 * 설명: HTTP 연결을 처리하고 방/제출/연습 실행/운영 엔드포인트 및 WS 업그레이드를 제공한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "arena/config.hpp"
#include "arena/identity.hpp"
#include "arena/match_service.hpp"
#include "arena/observability.hpp"
#include "arena/realtime.hpp"
#include "arena/websocket_session.hpp"

namespace arena {

using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<IdentityVerifier> identity, std::shared_ptr<MatchService> match_service,
              std::shared_ptr<NotificationHub> hub, std::shared_ptr<boost::asio::thread_pool> execution_pool,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(const std::shared_ptr<HttpResponse>& res, const std::string& path);
  void HandleSubmit(const std::shared_ptr<HttpResponse>& res, const Identity& identity, const std::string& room_id);
  void HandlePracticeRun(const std::shared_ptr<HttpResponse>& res, const std::string& problem_id);
  void SendResponse(std::shared_ptr<HttpResponse> res);
  void HandleWebSocket();
  std::optional<Identity> ExtractIdentity();
  bool HasOpsToken() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<IdentityVerifier> identity_;
  std::shared_ptr<MatchService> match_service_;
  std::shared_ptr<NotificationHub> hub_;
  std::shared_ptr<boost::asio::thread_pool> execution_pool_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> user_id_;
};

}  // namespace arena
