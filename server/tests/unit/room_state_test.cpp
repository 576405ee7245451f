#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "arena/memory_room_store.hpp"

namespace {

arena::Room WaitingRoom(const std::string& id, std::int64_t expires_at_ms) {
  arena::Room room;
  room.room_id = id;
  room.problem_id = "sum-two";
  room.host_id = "host";
  room.status = arena::RoomStatus::kWaiting;
  room.created_at_ms = 0;
  room.lobby_expires_at_ms = expires_at_ms;
  return room;
}

}  // namespace

TEST(RoomStateTest, InsertRejectsDuplicateId) {
  arena::MemoryRoomStore store;
  EXPECT_TRUE(store.Insert(WaitingRoom("ABC-123", 1000)));
  EXPECT_FALSE(store.Insert(WaitingRoom("ABC-123", 1000)));
}

TEST(RoomStateTest, JoinRules) {
  arena::MemoryRoomStore store;
  store.Insert(WaitingRoom("ABC-123", 1000));

  EXPECT_EQ(store.JoinAsOpponent("ZZZ-999", "bob", 10).error, arena::StoreError::kNotFound);
  EXPECT_EQ(store.JoinAsOpponent("ABC-123", "host", 10).error, arena::StoreError::kSelfJoin);

  auto joined = store.JoinAsOpponent("ABC-123", "bob", 10);
  ASSERT_EQ(joined.error, arena::StoreError::kNone);
  ASSERT_TRUE(joined.room.has_value());
  EXPECT_EQ(joined.room->status, arena::RoomStatus::kStarting);
  EXPECT_EQ(joined.room->opponent_id, "bob");

  EXPECT_EQ(store.JoinAsOpponent("ABC-123", "carol", 20).error, arena::StoreError::kFull);
}

TEST(RoomStateTest, JoinAfterDeadlineExpiresRoom) {
  arena::MemoryRoomStore store;
  store.Insert(WaitingRoom("ABC-123", 1000));
  auto late = store.JoinAsOpponent("ABC-123", "bob", 1000);
  EXPECT_EQ(late.error, arena::StoreError::kExpired);
  EXPECT_TRUE(late.expired_now);
  EXPECT_EQ(store.Find("ABC-123")->status, arena::RoomStatus::kExpired);

  auto again = store.JoinAsOpponent("ABC-123", "carol", 1001);
  EXPECT_EQ(again.error, arena::StoreError::kExpired);
  EXPECT_FALSE(again.expired_now);
  EXPECT_FALSE(store.ExpireIfWaiting("ABC-123"));
}

TEST(RoomStateTest, ConcurrentJoinAdmitsExactlyOne) {
  arena::MemoryRoomStore store;
  store.Insert(WaitingRoom("ABC-123", 1000000));
  std::atomic<int> admitted{0};
  std::atomic<int> full{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i]() {
      auto outcome = store.JoinAsOpponent("ABC-123", "user-" + std::to_string(i), 10);
      if (outcome.error == arena::StoreError::kNone) {
        ++admitted;
      } else if (outcome.error == arena::StoreError::kFull) {
        ++full;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(admitted.load(), 1);
  EXPECT_EQ(full.load(), 7);
}

TEST(RoomStateTest, ReadyIsIdempotentAndOnlyInStarting) {
  arena::MemoryRoomStore store;
  store.Insert(WaitingRoom("ABC-123", 1000000));
  EXPECT_EQ(store.MarkReady("ABC-123", "host").error, arena::StoreError::kNotStarting);
  store.JoinAsOpponent("ABC-123", "bob", 10);

  EXPECT_EQ(store.MarkReady("ABC-123", "carol").error, arena::StoreError::kNotParticipant);
  EXPECT_EQ(store.MarkReady("NOP-000", "host").error, arena::StoreError::kNotFound);

  auto first = store.MarkReady("ABC-123", "host");
  EXPECT_TRUE(first.changed);
  EXPECT_TRUE(first.host_ready);
  EXPECT_FALSE(first.BothReady());

  auto repeat = store.MarkReady("ABC-123", "host");
  EXPECT_EQ(repeat.error, arena::StoreError::kNone);
  EXPECT_FALSE(repeat.changed);

  EXPECT_FALSE(store.StartMatch("ABC-123", 50));

  auto second = store.MarkReady("ABC-123", "bob");
  EXPECT_TRUE(second.changed);
  EXPECT_TRUE(second.BothReady());

  EXPECT_TRUE(store.StartMatch("ABC-123", 50));
  EXPECT_FALSE(store.StartMatch("ABC-123", 60));
  auto room = store.Find("ABC-123");
  EXPECT_EQ(room->status, arena::RoomStatus::kInProgress);
  EXPECT_EQ(room->started_at_ms, 50);
  EXPECT_EQ(store.MarkReady("ABC-123", "bob").error, arena::StoreError::kNotStarting);
}

TEST(RoomStateTest, FinishIsGuardedAndSubmissionsStillRecorded) {
  arena::MemoryRoomStore store;
  store.Insert(WaitingRoom("ABC-123", 1000000));
  store.JoinAsOpponent("ABC-123", "bob", 10);

  arena::FinishRecord record{std::string("host"), arena::OutcomeKind::kFull, 100, 5};
  EXPECT_FALSE(store.FinishRoom("ABC-123", record));

  store.MarkReady("ABC-123", "host");
  store.MarkReady("ABC-123", "bob");
  store.StartMatch("ABC-123", 50);

  arena::FinishRecord stranger{std::string("carol"), arena::OutcomeKind::kFull, 100, 5};
  EXPECT_FALSE(store.FinishRoom("ABC-123", stranger));

  EXPECT_TRUE(store.FinishRoom("ABC-123", record));
  arena::FinishRecord rival{std::string("bob"), arena::OutcomeKind::kFull, 101, 5};
  EXPECT_FALSE(store.FinishRoom("ABC-123", rival));

  arena::Submission late;
  late.user_id = "bob";
  late.result = arena::SubmissionResult::kAccepted;
  EXPECT_TRUE(store.AppendSubmission("ABC-123", late));
  EXPECT_FALSE(store.AppendSubmission("NOP-000", late));

  auto room = store.Find("ABC-123");
  EXPECT_EQ(room->status, arena::RoomStatus::kFinished);
  EXPECT_EQ(room->winner_id, "host");
  EXPECT_EQ(room->outcome_kind, arena::OutcomeKind::kFull);
  EXPECT_EQ(room->match_duration_seconds, 5);
  EXPECT_EQ(room->submissions.size(), 1u);
}

TEST(RoomStateTest, FinishWithSubmissionCountRejectsLaterSubmission) {
  arena::MemoryRoomStore store;
  store.Insert(WaitingRoom("ABC-123", 1000000));
  store.JoinAsOpponent("ABC-123", "bob", 10);
  store.MarkReady("ABC-123", "host");
  store.MarkReady("ABC-123", "bob");
  store.StartMatch("ABC-123", 50);

  arena::Submission first;
  first.user_id = "host";
  store.AppendSubmission("ABC-123", first);
  arena::Submission second;
  second.user_id = "bob";
  store.AppendSubmission("ABC-123", second);

  arena::FinishRecord record{std::string("host"), arena::OutcomeKind::kPartial, 100, 5};
  record.expected_submissions = 2;
  arena::Submission third;
  third.user_id = "bob";
  store.AppendSubmission("ABC-123", third);

  EXPECT_FALSE(store.FinishRoom("ABC-123", record));
  EXPECT_EQ(store.Find("ABC-123")->status, arena::RoomStatus::kInProgress);

  record.expected_submissions = 3;
  EXPECT_TRUE(store.FinishRoom("ABC-123", record));
  EXPECT_EQ(store.Find("ABC-123")->winner_id, "host");
}

TEST(RoomStateTest, ListAndCountActive) {
  arena::MemoryRoomStore store;
  store.Insert(WaitingRoom("AAA-111", 1000000));
  store.Insert(WaitingRoom("BBB-222", 1000000));
  store.Insert(WaitingRoom("CCC-333", 1000000));
  store.ExpireIfWaiting("CCC-333");
  store.JoinAsOpponent("BBB-222", "bob", 10);
  EXPECT_EQ(store.CountActive(), 2u);
  EXPECT_EQ(store.ListByStatus(arena::RoomStatus::kWaiting).size(), 1u);
  EXPECT_EQ(store.ListByStatus(arena::RoomStatus::kStarting).size(), 1u);
  EXPECT_EQ(store.ListByStatus(arena::RoomStatus::kExpired).size(), 1u);
}
