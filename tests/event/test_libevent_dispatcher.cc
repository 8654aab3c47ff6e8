#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "conductor/event/libevent_dispatcher.h"

namespace conductor {
namespace event {
namespace {

class LibeventDispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = std::make_unique<LibeventDispatcher>("test");
  }

  void TearDown() override {
    if (thread_.joinable()) {
      dispatcher_->exit();
      thread_.join();
    }
    dispatcher_.reset();
  }

  void runInBackground() {
    thread_ = std::thread(
        [this]() { dispatcher_->run(RunType::RunUntilExit); });
  }

  template <typename Pred>
  bool waitFor(Pred pred, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
      if (pred()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
  }

  std::unique_ptr<LibeventDispatcher> dispatcher_;
  std::thread thread_;
};

TEST_F(LibeventDispatcherTest, NameIsKept) {
  EXPECT_EQ(dispatcher_->name(), "test");
  EXPECT_FALSE(dispatcher_->isThreadSafe());
}

TEST_F(LibeventDispatcherTest, PostedCallbacksRunOnLoopThread) {
  std::atomic<bool> ran{false};
  std::atomic<bool> on_loop_thread{false};

  runInBackground();
  dispatcher_->post([&]() {
    on_loop_thread = dispatcher_->isThreadSafe();
    ran = true;
  });

  EXPECT_TRUE(waitFor([&]() { return ran.load(); },
                      std::chrono::milliseconds(2000)));
  EXPECT_TRUE(on_loop_thread);
}

TEST_F(LibeventDispatcherTest, PostsBeforeRunAreDrained) {
  int count = 0;
  dispatcher_->post([&]() { ++count; });
  dispatcher_->post([&]() { ++count; });
  dispatcher_->run(RunType::NonBlock);
  EXPECT_EQ(count, 2);
}

TEST_F(LibeventDispatcherTest, TimerFiresAndCanRearm) {
  std::atomic<int> fired{0};
  TimerPtr timer;

  runInBackground();
  dispatcher_->post([&]() {
    timer = dispatcher_->createTimer([&]() {
      if (++fired < 3) {
        timer->enableTimer(std::chrono::milliseconds(5));
      }
    });
    timer->enableTimer(std::chrono::milliseconds(5));
  });

  EXPECT_TRUE(waitFor([&]() { return fired.load() >= 3; },
                      std::chrono::milliseconds(2000)));

  dispatcher_->exit();
  thread_.join();
  timer.reset();
  EXPECT_EQ(fired.load(), 3);
}

TEST_F(LibeventDispatcherTest, DisabledTimerDoesNotFire) {
  std::atomic<bool> fired{false};
  std::atomic<bool> armed{false};
  TimerPtr timer;

  runInBackground();
  dispatcher_->post([&]() {
    timer = dispatcher_->createTimer([&]() { fired = true; });
    timer->enableTimer(std::chrono::milliseconds(50));
    EXPECT_TRUE(timer->enabled());
    timer->disableTimer();
    EXPECT_FALSE(timer->enabled());
    armed = true;
  });

  ASSERT_TRUE(waitFor([&]() { return armed.load(); },
                      std::chrono::milliseconds(2000)));
  std::this_thread::sleep_for(std::chrono::milliseconds(120));
  EXPECT_FALSE(fired);

  dispatcher_->exit();
  thread_.join();
  timer.reset();
}

TEST_F(LibeventDispatcherTest, ExitBeforeRunReturnsImmediately) {
  dispatcher_->exit();

  auto start = std::chrono::steady_clock::now();
  dispatcher_->run(RunType::RunUntilExit);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST_F(LibeventDispatcherTest, ExitFromOtherThreadStopsLoop) {
  runInBackground();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  auto start = std::chrono::steady_clock::now();
  dispatcher_->exit();
  thread_.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(1000));
}

}  // namespace
}  // namespace event
}  // namespace conductor
