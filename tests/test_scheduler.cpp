#include <gtest/gtest.h>

#include <asio.hpp>
#include <atomic>
#include <future>
#include <thread>
#include <vector>

#include "core/scheduler.hpp"
#include "helpers/manual_scheduler.hpp"

using namespace conductor;
using conductor::testing::ManualScheduler;
using namespace std::chrono_literals;

// ============================================================
// AsioScheduler
// ============================================================

TEST(AsioSchedulerTest, PostRunsOnIoContext) {
  asio::io_context io_ctx;
  AsioScheduler scheduler(io_ctx);

  int runs = 0;
  scheduler.post([&]() { ++runs; });
  EXPECT_EQ(runs, 0);

  io_ctx.run();
  EXPECT_EQ(runs, 1);
}

TEST(AsioSchedulerTest, TimerFires) {
  asio::io_context io_ctx;
  AsioScheduler scheduler(io_ctx);

  bool fired = false;
  scheduler.schedule(10ms, [&]() { fired = true; });
  EXPECT_EQ(scheduler.active_timers(), 1u);

  io_ctx.run();
  EXPECT_TRUE(fired);
  EXPECT_EQ(scheduler.active_timers(), 0u);
}

TEST(AsioSchedulerTest, CancelledTimerDoesNotFire) {
  asio::io_context io_ctx;
  AsioScheduler scheduler(io_ctx);

  bool fired = false;
  auto id = scheduler.schedule(10ms, [&]() { fired = true; });
  EXPECT_TRUE(scheduler.cancel(id));
  EXPECT_FALSE(scheduler.cancel(id));

  io_ctx.run();
  EXPECT_FALSE(fired);
}

TEST(AsioSchedulerTest, ThrowingTaskDoesNotStopLoop) {
  asio::io_context io_ctx;
  AsioScheduler scheduler(io_ctx);

  bool second = false;
  scheduler.post([]() { throw std::runtime_error("boom"); });
  scheduler.post([&]() { second = true; });

  EXPECT_NO_THROW(io_ctx.run());
  EXPECT_TRUE(second);
}

TEST(AsioSchedulerTest, PostFromAnotherThread) {
  asio::io_context io_ctx;
  AsioScheduler scheduler(io_ctx);
  auto work = asio::make_work_guard(io_ctx);
  std::thread io_thread([&io_ctx]() { io_ctx.run(); });

  std::atomic<int> runs{0};
  std::promise<void> done;
  for (int i = 0; i < 10; ++i) {
    scheduler.post([&]() {
      if (++runs == 10) done.set_value();
    });
  }
  done.get_future().wait();

  work.reset();
  io_ctx.stop();
  io_thread.join();
  EXPECT_EQ(runs.load(), 10);
}

// ============================================================
// ManualScheduler (test helper)
// ============================================================

TEST(ManualSchedulerTest, TimersFireInDeadlineOrder) {
  ManualScheduler scheduler;
  std::vector<int> order;

  scheduler.schedule(300ms, [&]() { order.push_back(3); });
  scheduler.schedule(100ms, [&]() { order.push_back(1); });
  scheduler.schedule(200ms, [&]() { order.push_back(2); });

  scheduler.advance(250ms);
  EXPECT_EQ(order, (std::vector<int>{1, 2}));

  scheduler.advance(50ms);
  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(ManualSchedulerTest, NestedTimersUseVirtualClock) {
  ManualScheduler scheduler;
  auto start = scheduler.now();
  Scheduler::Clock::time_point fired_at{};

  scheduler.schedule(100ms, [&]() {
    scheduler.schedule(100ms, [&]() { fired_at = scheduler.now(); });
  });

  scheduler.advance(1s);
  EXPECT_EQ(fired_at - start, 200ms);
  EXPECT_EQ(scheduler.now() - start, 1s);
}
