/*
 * 설명: WebSocket 메시지를 읽어 방 구독/해제를 처리하고 서버 이벤트를 백프레셔 한도 안에서 전달한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#include "arena/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "arena/db_client.hpp"
#include "arena/room_id.hpp"

namespace arena {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   const Identity& identity, std::shared_ptr<NotificationHub> hub,
                                   std::shared_ptr<MatchService> match_service,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), identity_(identity), hub_(std::move(hub)), match_service_(std::move(match_service)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { hub_->Unregister(this); }

void WebSocketSession::Run() {
  hub_->Register(identity_.user_id, shared_from_this());
  SendAuthState();
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed || closing_) {
    return;
  }
  if (ec) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  auto message = nlohmann::json::parse(data, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    SendError("bad_request", "JSON 파싱 오류", 0);
    return DoRead();
  }

  std::uint64_t seq = 0;
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  auto event_it = message.find("event");
  if (type_it == message.end() || !type_it->is_string() || *type_it != "event" || event_it == message.end() ||
      !event_it->is_string()) {
    SendError("bad_request", "잘못된 메시지 형식", seq);
    return DoRead();
  }
  auto payload_it = message.find("p");
  if (payload_it == message.end() || !payload_it->is_object()) {
    SendError("bad_request", "payload가 누락되었습니다", seq);
    return DoRead();
  }

  try {
    if (*event_it == "room.subscribe") {
      HandleSubscribe(*payload_it, seq);
    } else if (*event_it == "room.unsubscribe") {
      HandleUnsubscribe(*payload_it, seq);
    } else {
      SendError("bad_request", "알 수 없는 이벤트", seq);
    }
  } catch (const DbException& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "ws_store_error", ex.what(), std::nullopt,
                            {{"dbCode", ex.code}, {"userId", identity_.user_id}});
    }
    SendError("store_unavailable", "저장소를 일시적으로 사용할 수 없습니다", seq);
  }

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::HandleSubscribe(const nlohmann::json& payload, std::uint64_t seq) {
  if (!payload.contains("roomId") || !payload["roomId"].is_string()) {
    SendError("bad_request", "roomId가 필요합니다", seq);
    return;
  }
  const std::string room_id = NormalizeRoomId(payload["roomId"].get<std::string>());
  std::string error_code;
  std::string error_message;
  if (!match_service_->CanSubscribe(identity_.user_id, room_id, error_code, error_message)) {
    SendError(error_code, error_message, seq);
    return;
  }
  hub_->Subscribe(this, room_id);
  // 놓친 이벤트는 구독 응답의 방 스냅샷으로 맞춘다.
  auto view = match_service_->GetRoomView(room_id, false, error_code, error_message);
  WsEnvelope env{.type = "event",
                 .event = "room.subscribed",
                 .seq = seq,
                 .payload = {{"roomId", room_id}, {"room", view ? *view : nlohmann::json(nullptr)}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::HandleUnsubscribe(const nlohmann::json& payload, std::uint64_t seq) {
  if (!payload.contains("roomId") || !payload["roomId"].is_string()) {
    SendError("bad_request", "roomId가 필요합니다", seq);
    return;
  }
  const std::string room_id = NormalizeRoomId(payload["roomId"].get<std::string>());
  hub_->Unsubscribe(this, room_id);
  WsEnvelope env{.type = "event", .event = "room.unsubscribed", .seq = seq, .payload = {{"roomId", room_id}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::SendServerEvent(const std::string& event, const nlohmann::json& payload) {
  WsEnvelope env{.type = "event", .event = event, .seq = 0, .payload = payload};
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(),
                    [self, text = ToWsJson(env).dump()]() mutable { self->EnqueueMessage(std::move(text)); });
}

void WebSocketSession::SendServerError(const std::string& code, const std::string& message) {
  WsEnvelope env{.type = "error", .event = "", .seq = 0, .payload = {{"code", code}, {"message", message}}};
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(),
                    [self, text = ToWsJson(env).dump()]() mutable { self->EnqueueMessage(std::move(text)); });
}

void WebSocketSession::SendAuthState() {
  WsEnvelope env{.type = "event",
                 .event = "auth_state",
                 .seq = 0,
                 .payload = {{"userId", identity_.user_id}, {"username", identity_.username}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  if (ec) {
    closing_ = true;
    return;
  }
  writing_ = false;
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  if (observability_) {
    observability_->Event(LogLevel::kWarn, "ws_backpressure_close", "송신 큐 한도 초과", std::nullopt,
                          {{"userId", identity_.user_id}});
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

}  // namespace arena
