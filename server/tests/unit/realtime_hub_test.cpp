#include <gtest/gtest.h>

#include "arena/realtime.hpp"
#include "unit/fakes.hpp"

TEST(RealtimeHubTest, BroadcastReachesOnlyRoomSubscribers) {
  arena::NotificationHub hub;
  auto alice = std::make_shared<arena_test::RecordingSubscriber>();
  auto bob = std::make_shared<arena_test::RecordingSubscriber>();
  auto carol = std::make_shared<arena_test::RecordingSubscriber>();
  hub.Register("alice", alice);
  hub.Register("bob", bob);
  hub.Register("carol", carol);

  hub.SubscribeUser("alice", "ABC-123");
  EXPECT_TRUE(hub.Subscribe(bob.get(), "ABC-123"));
  EXPECT_EQ(hub.SubscriberCount("ABC-123"), 2u);

  hub.BroadcastToRoom("ABC-123", "player-joined", {{"roomId", "ABC-123"}});
  EXPECT_EQ(alice->Count("player-joined"), 1u);
  EXPECT_EQ(bob->Count("player-joined"), 1u);
  EXPECT_EQ(carol->Count("player-joined"), 0u);

  hub.BroadcastToRoom("ABC-123", "opponent-submitted", {{"userId", "alice"}}, std::string("alice"));
  EXPECT_EQ(alice->Count("opponent-submitted"), 0u);
  EXPECT_EQ(bob->Count("opponent-submitted"), 1u);
}

TEST(RealtimeHubTest, UnsubscribeDropAndUnregister) {
  arena::NotificationHub hub;
  auto alice = std::make_shared<arena_test::RecordingSubscriber>();
  auto bob = std::make_shared<arena_test::RecordingSubscriber>();
  hub.Register("alice", alice);
  hub.Register("bob", bob);
  hub.Subscribe(alice.get(), "ABC-123");
  hub.Subscribe(bob.get(), "ABC-123");

  hub.Unsubscribe(bob.get(), "ABC-123");
  hub.BroadcastToRoom("ABC-123", "match-countdown", {{"count", 3}});
  EXPECT_EQ(bob->Count("match-countdown"), 0u);
  EXPECT_EQ(alice->Count("match-countdown"), 1u);

  hub.DropRoom("ABC-123");
  EXPECT_EQ(hub.SubscriberCount("ABC-123"), 0u);
  hub.BroadcastToRoom("ABC-123", "match-countdown", {{"count", 2}});
  EXPECT_EQ(alice->Count("match-countdown"), 1u);

  EXPECT_EQ(hub.ActiveConnections(), 2u);
  hub.Unregister(alice.get());
  EXPECT_EQ(hub.ActiveConnections(), 1u);
  EXPECT_FALSE(hub.Subscribe(alice.get(), "ABC-123"));
}

TEST(RealtimeHubTest, DirectMessagesHitEveryConnectionOfUser) {
  arena::NotificationHub hub;
  auto tab1 = std::make_shared<arena_test::RecordingSubscriber>();
  auto tab2 = std::make_shared<arena_test::RecordingSubscriber>();
  hub.Register("alice", tab1);
  hub.Register("alice", tab2);
  hub.SendEventToUser("alice", "room-expired", {{"roomId", "ABC-123"}});
  hub.SendErrorToUser("alice", "store_unavailable", "잠시 후");
  EXPECT_EQ(tab1->Count("room-expired"), 1u);
  EXPECT_EQ(tab2->Count("room-expired"), 1u);
  EXPECT_TRUE(tab1->Messages().back().is_error);
}

TEST(RealtimeHubTest, ExpiredSubscriberIsSkipped) {
  arena::NotificationHub hub;
  auto observability = std::make_shared<arena::Observability>(arena::LogLevel::kError);
  hub.SetObservability(observability);
  {
    auto gone = std::make_shared<arena_test::RecordingSubscriber>();
    hub.Register("ghost", gone);
    hub.Subscribe(gone.get(), "ABC-123");
  }
  EXPECT_EQ(observability->Snapshot(0).websocket_active, 1u);
  hub.BroadcastToRoom("ABC-123", "match-started", {{"roomId", "ABC-123"}});
  hub.SendEventToUser("ghost", "room-expired", nlohmann::json::object());
  SUCCEED();
}
