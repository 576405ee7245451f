#include <atomic>
#include <cstdlib>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "arena/problem_catalog.hpp"
#include "arena/room_repository.hpp"
#include "arena/settlement.hpp"

namespace {

arena::DbConfig TestDbConfig() {
  arena::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "arena_db";
  return cfg;
}

arena::Room WaitingRoom(const std::string& id, std::int64_t expires_at_ms) {
  arena::Room room;
  room.room_id = id;
  room.problem_id = "it-sum";
  room.host_id = "host";
  room.status = arena::RoomStatus::kWaiting;
  room.created_at_ms = 1;
  room.lobby_expires_at_ms = expires_at_ms;
  return room;
}

class RoomRepositoryIt : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<arena::MariaDbClient>(TestDbConfig());
    repository_ = std::make_shared<arena::RoomRepository>(db_client_);
    repository_->ClearAll();
    SeedProblem();
  }

  void SeedProblem() {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      db_client_->Execute(conn, "DELETE FROM problem_test_cases WHERE problem_id='it-sum';", "케이스 정리");
      db_client_->Execute(conn, "DELETE FROM problems WHERE problem_id='it-sum';", "문제 정리");
      db_client_->Execute(conn,
                          "INSERT INTO problems (problem_id, title, description, difficulty, time_limit_ms, "
                          "allowed_languages) VALUES ('it-sum', '합', '두 수의 합', 'hard', NULL, "
                          "'[\"python\",\"java\"]');",
                          "문제 삽입");
      db_client_->Execute(conn,
                          "INSERT INTO problem_test_cases (problem_id, ordinal, is_sample, input_text, "
                          "expected_output) VALUES ('it-sum', 0, 1, '1 2', '3'), ('it-sum', 1, 0, '5 5', '10'), "
                          "('it-sum', 0, 0, '2 2', '4');",
                          "케이스 삽입");
    });
  }

  void StartRoom(const std::string& room_id) {
    ASSERT_TRUE(repository_->Insert(WaitingRoom(room_id, 1'000'000)));
    ASSERT_EQ(repository_->JoinAsOpponent(room_id, "guest", 10).error, arena::StoreError::kNone);
    repository_->MarkReady(room_id, "host");
    repository_->MarkReady(room_id, "guest");
    ASSERT_TRUE(repository_->StartMatch(room_id, 500));
  }

  std::shared_ptr<arena::MariaDbClient> db_client_;
  std::shared_ptr<arena::RoomRepository> repository_;
};

}  // namespace

TEST_F(RoomRepositoryIt, InsertFindAndDuplicate) {
  ASSERT_TRUE(repository_->Insert(WaitingRoom("ITA-001", 1000)));
  EXPECT_FALSE(repository_->Insert(WaitingRoom("ITA-001", 1000)));
  auto room = repository_->Find("ITA-001");
  ASSERT_TRUE(room.has_value());
  EXPECT_EQ(room->status, arena::RoomStatus::kWaiting);
  EXPECT_EQ(room->host_id, "host");
  EXPECT_FALSE(room->opponent_id.has_value());
  EXPECT_EQ(room->lobby_expires_at_ms, 1000);
  EXPECT_FALSE(repository_->Find("ITA-999").has_value());
}

TEST_F(RoomRepositoryIt, JoinRulesAndExpiryOnJoin) {
  repository_->Insert(WaitingRoom("ITA-002", 1000));
  EXPECT_EQ(repository_->JoinAsOpponent("ITA-002", "host", 10).error, arena::StoreError::kSelfJoin);
  auto late = repository_->JoinAsOpponent("ITA-002", "guest", 2000);
  EXPECT_EQ(late.error, arena::StoreError::kExpired);
  EXPECT_TRUE(late.expired_now);
  EXPECT_EQ(repository_->Find("ITA-002")->status, arena::RoomStatus::kExpired);
  EXPECT_FALSE(repository_->ExpireIfWaiting("ITA-002"));

  repository_->Insert(WaitingRoom("ITA-003", 1'000'000));
  EXPECT_TRUE(repository_->ExpireIfWaiting("ITA-003"));
  EXPECT_EQ(repository_->JoinAsOpponent("ITA-003", "guest", 10).error, arena::StoreError::kExpired);
}

TEST_F(RoomRepositoryIt, ConcurrentJoinAdmitsExactlyOne) {
  repository_->Insert(WaitingRoom("ITA-004", 1'000'000));
  std::atomic<int> admitted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&, i]() {
      if (repository_->JoinAsOpponent("ITA-004", "user-" + std::to_string(i), 10).error == arena::StoreError::kNone) {
        ++admitted;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(admitted.load(), 1);
  EXPECT_EQ(repository_->Find("ITA-004")->status, arena::RoomStatus::kStarting);
}

TEST_F(RoomRepositoryIt, ReadyFlagsAndStart) {
  repository_->Insert(WaitingRoom("ITA-005", 1'000'000));
  repository_->JoinAsOpponent("ITA-005", "guest", 10);
  EXPECT_TRUE(repository_->MarkReady("ITA-005", "host").changed);
  EXPECT_FALSE(repository_->MarkReady("ITA-005", "host").changed);
  EXPECT_EQ(repository_->MarkReady("ITA-005", "carol").error, arena::StoreError::kNotParticipant);
  EXPECT_FALSE(repository_->StartMatch("ITA-005", 100));
  EXPECT_TRUE(repository_->MarkReady("ITA-005", "guest").BothReady());
  EXPECT_TRUE(repository_->StartMatch("ITA-005", 100));
  EXPECT_EQ(repository_->ListByStatus(arena::RoomStatus::kInProgress).size(), 1u);
  EXPECT_EQ(repository_->CountActive(), 1u);
}

TEST_F(RoomRepositoryIt, SubmissionsPersistVerdicts) {
  StartRoom("ITA-006");
  arena::Submission sub;
  sub.user_id = "guest";
  sub.code = "print('한글')";
  sub.language = arena::Language::kPython;
  sub.result = arena::SubmissionResult::kRejected;
  sub.submitted_at_ms = 700;
  sub.test_results = {arena::TestVerdict{0, true, "3", 4, std::nullopt, "", true},
                      arena::TestVerdict{1, false, "", 1000, arena::ErrorKind::kTimeLimitExceeded, "시간 제한 초과",
                                         false}};
  ASSERT_TRUE(repository_->AppendSubmission("ITA-006", sub));
  EXPECT_FALSE(repository_->AppendSubmission("ITA-404", sub));

  auto room = repository_->Find("ITA-006");
  ASSERT_EQ(room->submissions.size(), 1u);
  const auto& stored = room->submissions[0];
  EXPECT_EQ(stored.code, sub.code);
  EXPECT_EQ(stored.language, arena::Language::kPython);
  ASSERT_EQ(stored.test_results.size(), 2u);
  EXPECT_EQ(stored.test_results[1].error_kind, arena::ErrorKind::kTimeLimitExceeded);
  EXPECT_TRUE(room->HasSubmitted("guest"));
}

TEST_F(RoomRepositoryIt, FinishIsSingleWinner) {
  StartRoom("ITA-007");
  std::atomic<int> wins{0};
  std::vector<std::thread> threads;
  for (const std::string user : {"host", "guest", "host", "guest"}) {
    threads.emplace_back([&, user]() {
      arena::FinishRecord record{user, arena::OutcomeKind::kFull, 900, 3};
      if (repository_->FinishRoom("ITA-007", record)) {
        ++wins;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(wins.load(), 1);
  auto room = repository_->Find("ITA-007");
  EXPECT_EQ(room->status, arena::RoomStatus::kFinished);
  EXPECT_TRUE(room->winner_id.has_value());
  EXPECT_EQ(room->match_duration_seconds, 3);

  arena::Submission late;
  late.user_id = "host";
  late.code = "x";
  EXPECT_TRUE(repository_->AppendSubmission("ITA-007", late));
  EXPECT_EQ(repository_->Find("ITA-007")->winner_id, room->winner_id);
}

TEST_F(RoomRepositoryIt, FinishByScoreRequiresObservedSubmissionCount) {
  StartRoom("ITA-009");
  arena::Submission sub;
  sub.user_id = "host";
  sub.code = "a";
  ASSERT_TRUE(repository_->AppendSubmission("ITA-009", sub));
  sub.user_id = "guest";
  ASSERT_TRUE(repository_->AppendSubmission("ITA-009", sub));

  arena::FinishRecord record{std::string("host"), arena::OutcomeKind::kPartial, 900, 3};
  record.expected_submissions = 1;
  EXPECT_FALSE(repository_->FinishRoom("ITA-009", record));
  EXPECT_EQ(repository_->Find("ITA-009")->status, arena::RoomStatus::kInProgress);

  record.expected_submissions = 2;
  EXPECT_TRUE(repository_->FinishRoom("ITA-009", record));
  EXPECT_EQ(repository_->Find("ITA-009")->winner_id, "host");
}

TEST_F(RoomRepositoryIt, SettlementOutboxDeduplicates) {
  StartRoom("ITA-008");
  arena::MariaDbSettlementOutbox outbox(db_client_, nullptr);
  arena::SettlementEvent event{"ITA-008", std::nullopt, arena::OutcomeKind::kTimeout, 3600, arena::Difficulty::kHard};
  EXPECT_TRUE(outbox.Emit(event));
  EXPECT_FALSE(outbox.Emit(event));
}

TEST_F(RoomRepositoryIt, ProblemRepositoryLoadsOrderedCases) {
  arena::ProblemRepository problems(db_client_);
  auto problem = problems.GetProblem("it-sum");
  ASSERT_TRUE(problem.has_value());
  EXPECT_EQ(problem->difficulty, arena::Difficulty::kHard);
  EXPECT_EQ(problem->time_limit_ms, 0);
  EXPECT_TRUE(problem->AllowsLanguage(arena::Language::kJava));
  EXPECT_FALSE(problem->AllowsLanguage(arena::Language::kC));
  ASSERT_EQ(problem->sample_cases.size(), 1u);
  ASSERT_EQ(problem->hidden_cases.size(), 2u);
  EXPECT_EQ(problem->hidden_cases[0].expected_output, "4");
  EXPECT_EQ(problem->hidden_cases[1].expected_output, "10");
  EXPECT_FALSE(problems.GetProblem("missing").has_value());
}
