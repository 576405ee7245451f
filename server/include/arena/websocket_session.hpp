/*
 * 설명: WebSocket 연결의 메시지 처리, 방 구독 요청, 백프레셔, 서버 이벤트 전달을 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "arena/api_response.hpp"
#include "arena/identity.hpp"
#include "arena/match_service.hpp"
#include "arena/observability.hpp"
#include "arena/realtime.hpp"

namespace arena {

class WebSocketSession : public EventSubscriber, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, const Identity& identity,
                   std::shared_ptr<NotificationHub> hub, std::shared_ptr<MatchService> match_service,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 다른 스레드에서 호출될 수 있으므로 연결의 strand로 넘겨 큐에 넣는다.
  void SendServerEvent(const std::string& event, const nlohmann::json& payload) override;
  void SendServerError(const std::string& code, const std::string& message) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleSubscribe(const nlohmann::json& payload, std::uint64_t seq);
  void HandleUnsubscribe(const nlohmann::json& payload, std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void SendAuthState();
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  Identity identity_;
  std::shared_ptr<NotificationHub> hub_;
  std::shared_ptr<MatchService> match_service_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace arena
