#include "core/circuit_breaker.h"
#include "helpers/fake_scheduler.h"
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class CircuitBreakerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.failure_threshold = 3;
    config_.recovery_timeout = 5000ms;
    config_.success_threshold = 2;
    config_.max_retry_attempts = 3;
    config_.base_delay = 1000ms;
    config_.max_delay = 30000ms;
    config_.timeout = 10000ms;
    breaker_ = std::make_unique<CircuitBreaker>("websocket", config_,
                                                scheduler_);
  }

  void TearDown() override { breaker_.reset(); }

  void openBreaker() {
    for (int i = 0; i < config_.failure_threshold; ++i) {
      breaker_->recordFailure("websocket_connect");
    }
    ASSERT_EQ(breaker_->getState(), CircuitBreaker::State::Open);
  }

  FakeScheduler scheduler_;
  CircuitBreakerConfig config_;
  std::unique_ptr<CircuitBreaker> breaker_;
};

TEST_F(CircuitBreakerTest, StartsClosed) {
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::Closed);
  EXPECT_TRUE(breaker_->isCallAllowed());

  auto stats = breaker_->getStats();
  EXPECT_EQ(stats.failure_count, 0u);
  EXPECT_FALSE(stats.last_failure.has_value());
}

TEST_F(CircuitBreakerTest, InvalidConfigThrows) {
  CircuitBreakerConfig bad = config_;
  bad.max_retry_attempts = 0;
  EXPECT_THROW(CircuitBreaker("bad", bad, scheduler_), std::invalid_argument);

  bad = config_;
  bad.base_delay = 60000ms;
  EXPECT_THROW(CircuitBreaker("bad", bad, scheduler_), std::invalid_argument);
}

TEST_F(CircuitBreakerTest, OpensAtFailureThreshold) {
  breaker_->recordFailure("websocket_connect");
  breaker_->recordFailure("websocket_connect");
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::Closed);

  breaker_->recordFailure("websocket_connect");
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::Open);
  EXPECT_FALSE(breaker_->isCallAllowed());
}

TEST_F(CircuitBreakerTest, SuccessForgivesOneFailureWhenClosed) {
  breaker_->recordFailure("websocket_connect");
  breaker_->recordFailure("websocket_connect");
  breaker_->recordSuccess();

  EXPECT_EQ(breaker_->getStats().failure_count, 1u);
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::Closed);

  breaker_->recordSuccess();
  breaker_->recordSuccess();
  EXPECT_EQ(breaker_->getStats().failure_count, 0u);
}

TEST_F(CircuitBreakerTest, HalfOpenAfterRecoveryTimeout) {
  openBreaker();

  scheduler_.advance(4999ms);
  EXPECT_FALSE(breaker_->isCallAllowed());
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::Open);

  scheduler_.advance(1ms);
  EXPECT_TRUE(breaker_->isCallAllowed());
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::HalfOpen);
  EXPECT_EQ(breaker_->getStats().success_count, 0u);
}

TEST_F(CircuitBreakerTest, HalfOpenClosesAfterSuccessThreshold) {
  openBreaker();
  scheduler_.advance(config_.recovery_timeout);
  ASSERT_TRUE(breaker_->isCallAllowed());

  breaker_->recordSuccess();
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::HalfOpen);

  breaker_->recordSuccess();
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::Closed);
  EXPECT_EQ(breaker_->getStats().failure_count, 0u);
}

TEST_F(CircuitBreakerTest, FailureInHalfOpenReopens) {
  openBreaker();
  scheduler_.advance(config_.recovery_timeout);
  ASSERT_TRUE(breaker_->isCallAllowed());
  breaker_->recordSuccess();

  breaker_->recordFailure("websocket_connect");
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::Open);
  EXPECT_EQ(breaker_->getStats().success_count, 0u);

  // Recovery timer restarts from the new failure
  scheduler_.advance(config_.recovery_timeout - 1ms);
  EXPECT_FALSE(breaker_->isCallAllowed());
}

TEST_F(CircuitBreakerTest, HalfOpenAdmitsConcurrentCallers) {
  openBreaker();
  scheduler_.advance(config_.recovery_timeout);

  EXPECT_TRUE(breaker_->isCallAllowed());
  EXPECT_TRUE(breaker_->isCallAllowed());
  EXPECT_TRUE(breaker_->isCallAllowed());
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::HalfOpen);
}

TEST_F(CircuitBreakerTest, BackoffDoublesUpToMaxDelay) {
  EXPECT_EQ(breaker_->backoffDelay(0), 1000ms);
  EXPECT_EQ(breaker_->backoffDelay(1), 2000ms);
  EXPECT_EQ(breaker_->backoffDelay(2), 4000ms);
  EXPECT_EQ(breaker_->backoffDelay(4), 16000ms);
  EXPECT_EQ(breaker_->backoffDelay(5), 30000ms);
  EXPECT_EQ(breaker_->backoffDelay(1000), 30000ms);

  std::chrono::milliseconds previous{0};
  for (int attempt = 0; attempt < 64; ++attempt) {
    auto delay = breaker_->backoffDelay(attempt);
    EXPECT_GE(delay, previous);
    EXPECT_LE(delay, config_.max_delay);
    previous = delay;
  }
}

TEST_F(CircuitBreakerTest, AlwaysTimingOutCallRecordsOneFailure) {
  int attempts = 0;
  auto hanging = [&attempts](const CancellationTokenPtr &) {
    attempts++;
    FakeScheduler::simulateWork(60000ms);
  };

  EXPECT_THROW(breaker_->call(hanging, "websocket_connect"), OperationTimeout);

  EXPECT_EQ(attempts, 3);
  auto sleeps = scheduler_.sleeps();
  ASSERT_EQ(sleeps.size(), 2u);
  EXPECT_EQ(sleeps[0], 1000ms);
  EXPECT_EQ(sleeps[1], 2000ms);

  auto timeouts = scheduler_.timeouts();
  ASSERT_EQ(timeouts.size(), 3u);
  for (auto timeout : timeouts) {
    EXPECT_EQ(timeout, config_.timeout);
  }

  auto stats = breaker_->getStats();
  EXPECT_EQ(stats.failure_count, 1u);
  EXPECT_EQ(stats.total_attempts, 3u);
  EXPECT_EQ(stats.failed_calls, 1u);
  EXPECT_EQ(breaker_->getFailureHistory().at("websocket_connect"), 1u);
  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::Closed);
}

TEST_F(CircuitBreakerTest, FinalErrorIsLastAttemptError) {
  int attempts = 0;
  auto failing = [&attempts](const CancellationTokenPtr &) -> int {
    attempts++;
    throw std::runtime_error("refused #" + std::to_string(attempts));
  };

  try {
    breaker_->call(failing, "auth_handshake");
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error &e) {
    EXPECT_STREQ(e.what(), "refused #3");
  }
  EXPECT_EQ(breaker_->getFailureHistory().at("auth_handshake"), 1u);
}

TEST_F(CircuitBreakerTest, NonStandardErrorsAreRetriedAndRecorded) {
  int attempts = 0;
  auto failing = [&attempts](const CancellationTokenPtr &) {
    attempts++;
    throw 7;
  };

  EXPECT_THROW(breaker_->call(failing, "auth_handshake"), int);
  EXPECT_EQ(attempts, 3);
  EXPECT_EQ(scheduler_.sleeps().size(), 2u);
  EXPECT_EQ(breaker_->getStats().failed_calls, 1u);
  EXPECT_EQ(breaker_->getFailureHistory().at("auth_handshake"), 1u);
}

TEST_F(CircuitBreakerTest, OpenBreakerRejectsWithoutAttempt) {
  openBreaker();
  const size_t failures_before = breaker_->getStats().failure_count;

  int attempts = 0;
  auto operation = [&attempts](const CancellationTokenPtr &) { attempts++; };

  try {
    breaker_->call(operation, "websocket_connect");
    FAIL() << "Expected CircuitOpenError";
  } catch (const CircuitOpenError &e) {
    EXPECT_EQ(e.breaker(), "websocket");
    EXPECT_EQ(e.kind(), "websocket_connect");
  }

  EXPECT_EQ(attempts, 0);
  auto stats = breaker_->getStats();
  EXPECT_EQ(stats.failure_count, failures_before);
  EXPECT_EQ(stats.rejected_calls, 1u);
  EXPECT_EQ(stats.total_attempts, 0u);
  EXPECT_TRUE(scheduler_.timeouts().empty());
}

TEST_F(CircuitBreakerTest, RecoversAfterTransientFailures) {
  breaker_->recordFailure("database_query");
  int attempts = 0;
  auto flaky = [&attempts](const CancellationTokenPtr &) {
    if (++attempts < 3) {
      throw std::runtime_error("transient");
    }
    return 42;
  };

  EXPECT_EQ(breaker_->call(flaky, "database_query"), 42);
  EXPECT_EQ(attempts, 3);

  auto stats = breaker_->getStats();
  EXPECT_EQ(stats.successful_calls, 1u);
  EXPECT_EQ(stats.failed_calls, 0u);
  // The call's success forgave the earlier failure
  EXPECT_EQ(stats.failure_count, 0u);
  EXPECT_EQ(breaker_->getFailureHistory().at("database_query"), 1u);
}

TEST_F(CircuitBreakerTest, CancellationStopsRetrying) {
  auto cancel = std::make_shared<CancellationToken>();
  int attempts = 0;
  auto operation = [&](const CancellationTokenPtr &) {
    attempts++;
    cancel->cancel();
    throw std::runtime_error("connection reset");
  };

  EXPECT_THROW(breaker_->call(operation, "websocket_connect", cancel),
               OperationCancelled);
  EXPECT_EQ(attempts, 1);
  EXPECT_EQ(breaker_->getStats().failure_count, 0u);
  EXPECT_TRUE(breaker_->getFailureHistory().empty());
}

TEST_F(CircuitBreakerTest, CancelledBeforeStartMakesNoAttempt) {
  auto cancel = std::make_shared<CancellationToken>();
  cancel->cancel();

  int attempts = 0;
  auto operation = [&attempts](const CancellationTokenPtr &) { attempts++; };
  EXPECT_THROW(breaker_->call(operation, "websocket_connect", cancel),
               OperationCancelled);
  EXPECT_EQ(attempts, 0);
}

TEST_F(CircuitBreakerTest, ResetClosesAndKeepsHistory) {
  openBreaker();
  breaker_->reset();

  EXPECT_EQ(breaker_->getState(), CircuitBreaker::State::Closed);
  EXPECT_TRUE(breaker_->isCallAllowed());
  EXPECT_EQ(breaker_->getStats().failure_count, 0u);
  EXPECT_EQ(breaker_->getFailureHistory().at("websocket_connect"), 3u);
}

TEST_F(CircuitBreakerTest, ConcurrentFailuresAreAllCounted) {
  CircuitBreakerConfig config = config_;
  config.failure_threshold = 100000;
  CircuitBreaker breaker("concurrent", config, scheduler_);

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&breaker]() {
      for (int i = 0; i < 250; ++i) {
        breaker.recordFailure("redis_command");
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(breaker.getStats().failure_count, 2000u);
  EXPECT_EQ(breaker.getFailureHistory().at("redis_command"), 2000u);
}

TEST_F(CircuitBreakerTest, WorksWithSystemScheduler) {
  SystemScheduler scheduler;
  CircuitBreakerConfig config = config_;
  config.base_delay = 10ms;
  config.max_delay = 20ms;
  config.timeout = 50ms;
  CircuitBreaker breaker("system", config, scheduler);

  auto hanging = [](const CancellationTokenPtr &token) {
    token->waitFor(5000ms);
  };
  EXPECT_THROW(breaker.call(hanging, "websocket_connect"), OperationTimeout);
  EXPECT_EQ(breaker.getStats().total_attempts, 3u);
  EXPECT_EQ(breaker.getStats().failure_count, 1u);
}

TEST_F(CircuitBreakerTest, StateToString) {
  EXPECT_STREQ(CircuitBreaker::stateToString(CircuitBreaker::State::Closed),
               "CLOSED");
  EXPECT_STREQ(CircuitBreaker::stateToString(CircuitBreaker::State::Open),
               "OPEN");
  EXPECT_STREQ(CircuitBreaker::stateToString(CircuitBreaker::State::HalfOpen),
               "HALF_OPEN");
}
