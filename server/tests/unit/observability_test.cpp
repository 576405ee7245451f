#include <gtest/gtest.h>

#include "arena/observability.hpp"

TEST(ObservabilityTest, ParsesLogLevels) {
  EXPECT_EQ(arena::ParseLogLevel("debug"), arena::LogLevel::kDebug);
  EXPECT_EQ(arena::ParseLogLevel("warning"), arena::LogLevel::kWarn);
  EXPECT_EQ(arena::ParseLogLevel("error"), arena::LogLevel::kError);
  EXPECT_EQ(arena::ParseLogLevel("verbose"), arena::LogLevel::kInfo);
}

TEST(ObservabilityTest, CountersFeedSnapshot) {
  arena::Observability obs(arena::LogLevel::kError);
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.IncrementSubmission();
  obs.IncrementExecution();
  obs.IncrementExecution();
  obs.IncrementCleanupFailure();
  obs.SetWebsocketActive(3);
  auto snapshot = obs.Snapshot(7);
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.submissions_total, 1u);
  EXPECT_EQ(snapshot.executions_total, 2u);
  EXPECT_EQ(snapshot.cleanup_failures, 1u);
  EXPECT_EQ(snapshot.websocket_active, 3u);
  EXPECT_EQ(snapshot.active_rooms, 7u);
}

TEST(ObservabilityTest, MinimumLevelFiltersOutput) {
  arena::Observability obs(arena::LogLevel::kWarn);
  EXPECT_FALSE(obs.Enabled(arena::LogLevel::kInfo));
  EXPECT_TRUE(obs.Enabled(arena::LogLevel::kError));

  ::testing::internal::CaptureStdout();
  obs.Event(arena::LogLevel::kInfo, "quiet", "보이지 않음");
  obs.Event(arena::LogLevel::kWarn, "loud", "보임", std::string("ABC-123"), {{"k", 1}});
  auto out = ::testing::internal::GetCapturedStdout();
  EXPECT_EQ(out.find("quiet"), std::string::npos);
  auto line = nlohmann::json::parse(out);
  EXPECT_EQ(line["eventName"], "loud");
  EXPECT_EQ(line["roomId"], "ABC-123");
  EXPECT_EQ(line["fields"]["k"], 1);
}

TEST(ObservabilityTest, TraceIdsAreUnique) {
  arena::Observability obs;
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}
