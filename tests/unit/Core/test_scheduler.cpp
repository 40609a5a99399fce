#include "core/resilience_errors.h"
#include "core/scheduler.h"
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <thread>

using namespace std::chrono_literals;

TEST(SystemSchedulerTest, ReturnsTaskResult) {
  SystemScheduler scheduler;
  int value = runWithTimeout(
      scheduler, [](const CancellationTokenPtr &) { return 42; }, 1000ms);
  EXPECT_EQ(value, 42);
}

TEST(SystemSchedulerTest, TimeoutCancelsTaskToken) {
  SystemScheduler scheduler;
  auto observed = std::make_shared<std::atomic<bool>>(false);

  EXPECT_THROW(scheduler.runWithTimeout(
                   [observed](const CancellationTokenPtr &token) {
                     if (token->waitFor(5000ms)) {
                       observed->store(true);
                     }
                   },
                   50ms),
               OperationTimeout);

  for (int i = 0; i < 100 && !observed->load(); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_TRUE(observed->load());
}

TEST(SystemSchedulerTest, DestructorWaitsForAbandonedTask) {
  auto finished = std::make_shared<std::atomic<bool>>(false);
  {
    SystemScheduler scheduler;
    // Ignores its token, so it outlives the call
    EXPECT_THROW(scheduler.runWithTimeout(
                     [finished](const CancellationTokenPtr &) {
                       std::this_thread::sleep_for(200ms);
                       finished->store(true);
                     },
                     20ms),
                 OperationTimeout);
    EXPECT_EQ(scheduler.runningTasks(), 1u);
  }
  EXPECT_TRUE(finished->load());
}
