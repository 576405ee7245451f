/*
 * 설명: 방 단위 구독 관리와 이벤트 브로드캐스트를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/realtime_hub_test.cpp
 */
#include "arena/realtime.hpp"

#include <vector>

namespace arena {

void NotificationHub::Register(const std::string& user_id, const std::shared_ptr<EventSubscriber>& subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[subscriber.get()] = Entry{subscriber, user_id, {}};
  PublishActive();
}

void NotificationHub::Unregister(const EventSubscriber* subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(subscriber);
  if (it == connections_.end()) {
    return;
  }
  for (const auto& room_id : it->second.rooms) {
    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
      continue;
    }
    room_it->second.erase(subscriber);
    if (room_it->second.empty()) {
      rooms_.erase(room_it);
    }
  }
  connections_.erase(it);
  PublishActive();
}

bool NotificationHub::Subscribe(const EventSubscriber* subscriber, const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(subscriber);
  if (it == connections_.end()) {
    return false;
  }
  it->second.rooms.insert(room_id);
  rooms_[room_id].insert(subscriber);
  return true;
}

void NotificationHub::Unsubscribe(const EventSubscriber* subscriber, const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(subscriber);
  if (it != connections_.end()) {
    it->second.rooms.erase(room_id);
  }
  auto room_it = rooms_.find(room_id);
  if (room_it != rooms_.end()) {
    room_it->second.erase(subscriber);
    if (room_it->second.empty()) {
      rooms_.erase(room_it);
    }
  }
}

void NotificationHub::SubscribeUser(const std::string& user_id, const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [raw, entry] : connections_) {
    if (entry.user_id == user_id) {
      entry.rooms.insert(room_id);
      rooms_[room_id].insert(raw);
    }
  }
}

void NotificationHub::DropRoom(const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto room_it = rooms_.find(room_id);
  if (room_it == rooms_.end()) {
    return;
  }
  for (const auto* raw : room_it->second) {
    auto it = connections_.find(raw);
    if (it != connections_.end()) {
      it->second.rooms.erase(room_id);
    }
  }
  rooms_.erase(room_it);
}

void NotificationHub::BroadcastToRoom(const std::string& room_id, const std::string& event,
                                      const nlohmann::json& payload, const std::optional<std::string>& exclude_user_id) {
  std::vector<std::shared_ptr<EventSubscriber>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
      return;
    }
    for (const auto* raw : room_it->second) {
      auto it = connections_.find(raw);
      if (it == connections_.end()) {
        continue;
      }
      if (exclude_user_id && it->second.user_id == *exclude_user_id) {
        continue;
      }
      if (auto subscriber = it->second.subscriber.lock()) {
        targets.push_back(std::move(subscriber));
      }
    }
  }
  // 세션 쪽 전송은 자체 strand로 넘어가므로 잠금 밖에서 호출한다.
  for (const auto& subscriber : targets) {
    subscriber->SendServerEvent(event, payload);
  }
  if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
    observability_->Event(LogLevel::kDebug, "room_broadcast", event, room_id, {{"recipients", targets.size()}});
  }
}

void NotificationHub::SendEventToUser(const std::string& user_id, const std::string& event,
                                      const nlohmann::json& payload) {
  for (const auto& subscriber : CollectUser(user_id)) {
    subscriber->SendServerEvent(event, payload);
  }
}

void NotificationHub::SendErrorToUser(const std::string& user_id, const std::string& code,
                                      const std::string& message) {
  for (const auto& subscriber : CollectUser(user_id)) {
    subscriber->SendServerError(code, message);
  }
}

std::size_t NotificationHub::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t NotificationHub::SubscriberCount(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  return it == rooms_.end() ? 0 : it->second.size();
}

std::vector<std::shared_ptr<EventSubscriber>> NotificationHub::CollectUser(const std::string& user_id) const {
  std::vector<std::shared_ptr<EventSubscriber>> targets;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [raw, entry] : connections_) {
    if (entry.user_id != user_id) {
      continue;
    }
    if (auto subscriber = entry.subscriber.lock()) {
      targets.push_back(std::move(subscriber));
    }
  }
  return targets;
}

void NotificationHub::PublishActive() const {
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

}  // namespace arena
