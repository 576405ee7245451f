/*
 * 설명: 방 단위 구독자 집합을 관리하고 방 상태 전이 이벤트를 구독자에게 중계한다.
 *       전달은 최대 1회(best effort)이며 끊긴 클라이언트는 방 조회로 상태를 맞춘다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/realtime_hub_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "arena/observability.hpp"

namespace arena {

// 서버 이벤트를 받을 수 있는 연결. WebSocketSession이 구현하며 테스트는 기록용 가짜를 쓴다.
class EventSubscriber {
 public:
  virtual ~EventSubscriber() = default;
  virtual void SendServerEvent(const std::string& event, const nlohmann::json& payload) = 0;
  virtual void SendServerError(const std::string& code, const std::string& message) = 0;
};

class NotificationHub {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  void Register(const std::string& user_id, const std::shared_ptr<EventSubscriber>& subscriber);
  void Unregister(const EventSubscriber* subscriber);

  bool Subscribe(const EventSubscriber* subscriber, const std::string& room_id);
  void Unsubscribe(const EventSubscriber* subscriber, const std::string& room_id);
  // 사용자의 열린 연결 전부를 방에 구독시킨다. 방 생성/참가 시 참가자에게 쓴다.
  void SubscribeUser(const std::string& user_id, const std::string& room_id);
  // 종료된 방의 구독 정보를 정리한다.
  void DropRoom(const std::string& room_id);

  void BroadcastToRoom(const std::string& room_id, const std::string& event, const nlohmann::json& payload,
                       const std::optional<std::string>& exclude_user_id = std::nullopt);
  void SendEventToUser(const std::string& user_id, const std::string& event, const nlohmann::json& payload);
  void SendErrorToUser(const std::string& user_id, const std::string& code, const std::string& message);

  std::size_t ActiveConnections() const;
  std::size_t SubscriberCount(const std::string& room_id) const;

 private:
  struct Entry {
    std::weak_ptr<EventSubscriber> subscriber;
    std::string user_id;
    std::unordered_set<std::string> rooms;
  };

  std::vector<std::shared_ptr<EventSubscriber>> CollectUser(const std::string& user_id) const;
  void PublishActive() const;

  std::unordered_map<const EventSubscriber*, Entry> connections_;
  std::unordered_map<std::string, std::unordered_set<const EventSubscriber*>> rooms_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace arena
