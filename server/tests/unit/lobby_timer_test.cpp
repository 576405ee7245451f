#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "arena/lobby_timer.hpp"
#include "arena/room.hpp"

namespace {

class LobbyTimerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    timers_ = std::make_shared<arena::LobbyTimerManager>(io_, nullptr);
    timers_->SetHandler([this](const std::string& room_id) {
      std::lock_guard<std::mutex> lock(mutex_);
      fired_.push_back(room_id);
    });
    thread_ = std::thread([this]() { io_.run(); });
  }

  void TearDown() override {
    timers_->Shutdown();
    guard_.reset();
    io_.stop();
    thread_.join();
  }

  std::vector<std::string> Fired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
  }

  boost::asio::io_context io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_{io_.get_executor()};
  std::shared_ptr<arena::LobbyTimerManager> timers_;
  std::thread thread_;
  std::mutex mutex_;
  std::vector<std::string> fired_;
};

}  // namespace

TEST_F(LobbyTimerTest, FiresOnceAtDeadline) {
  timers_->Schedule("ABC-123", arena::NowMs() + 50);
  EXPECT_EQ(timers_->Pending(), 1u);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_TRUE(Fired().empty());
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  ASSERT_EQ(Fired().size(), 1u);
  EXPECT_EQ(Fired()[0], "ABC-123");
  EXPECT_EQ(timers_->Pending(), 0u);
}

TEST_F(LobbyTimerTest, PastDeadlineFiresImmediately) {
  timers_->Schedule("OLD-000", arena::NowMs() - 10'000);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  ASSERT_EQ(Fired().size(), 1u);
}

TEST_F(LobbyTimerTest, CancelPreventsFire) {
  timers_->Schedule("ABC-123", arena::NowMs() + 50);
  EXPECT_TRUE(timers_->Cancel("ABC-123"));
  EXPECT_FALSE(timers_->Cancel("ABC-123"));
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_TRUE(Fired().empty());
}

TEST_F(LobbyTimerTest, RescheduleReplacesExistingTimer) {
  timers_->Schedule("ABC-123", arena::NowMs() + 30);
  timers_->Schedule("ABC-123", arena::NowMs() + 150);
  EXPECT_EQ(timers_->Pending(), 1u);
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  EXPECT_TRUE(Fired().empty());
  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  EXPECT_EQ(Fired().size(), 1u);
}

TEST_F(LobbyTimerTest, ShutdownCancelsAndRejectsNewTimers) {
  timers_->Schedule("AAA-111", arena::NowMs() + 50);
  timers_->Schedule("BBB-222", arena::NowMs() + 50);
  timers_->Shutdown();
  timers_->Schedule("CCC-333", arena::NowMs());
  EXPECT_EQ(timers_->Pending(), 0u);
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  EXPECT_TRUE(Fired().empty());
}
