#pragma once

#include "config/circuit_breaker_config.h"
#include "core/cancellation_token.h"
#include "core/resilience_errors.h"
#include "core/scheduler.h"
#include <atomic>
#include <chrono>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <plog/Log.h>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * @brief Circuit breaker with retries and exponential backoff
 *
 * Wraps retryable operations for one logical domain (e.g.
 * "websocket_connect"). Each call() makes up to max_retry_attempts attempts,
 * each bounded by the configured timeout, sleeping
 * min(base_delay * 2^attempt, max_delay) between them. Only the final
 * failure of a call is recorded against the breaker.
 *
 * State transitions are serialized by a mutex; the lock is never held while
 * an attempt runs or while sleeping. HALF_OPEN lets every caller through.
 *
 * One instance is constructed at startup and shared by reference.
 */
class CircuitBreaker {
public:
  enum class State {
    Closed,  // Normal operation
    Open,    // Failing, reject requests immediately
    HalfOpen // Testing if service recovered
  };

  /**
   * @param name Domain label used in logs and CircuitOpenError
   * @param config Validated on construction
   * @param scheduler Clock, sleeps and per-attempt timeouts
   * @throws std::invalid_argument if config is invalid
   */
  CircuitBreaker(std::string name, CircuitBreakerConfig config,
                 IScheduler &scheduler);

  CircuitBreaker(const CircuitBreaker &) = delete;
  CircuitBreaker &operator=(const CircuitBreaker &) = delete;

  /**
   * @brief Execute operation with retries under breaker protection
   *
   * operation is invoked as operation(const CancellationTokenPtr &). The
   * token is cancelled when an attempt times out or cancel is signalled;
   * pass it on to nested calls so they stop with the attempt.
   *
   * @param operation Retryable operation
   * @param kind Operation kind label recorded in the failure history
   * @param cancel Optional caller token; cancellation stops retrying
   * @return Result of the first successful attempt
   * @throws CircuitOpenError if the breaker rejects the call (no attempt)
   * @throws OperationCancelled if cancel is signalled
   * @throws the last attempt's error once attempts are exhausted
   */
  template <typename Func>
  auto call(Func operation, const std::string &kind,
            const CancellationTokenPtr &cancel = nullptr)
      -> std::invoke_result_t<Func &, const CancellationTokenPtr &> {
    if (!isCallAllowed()) {
      rejected_calls_++;
      PLOG_DEBUG << "[CircuitBreaker] " << name_ << " rejected " << kind;
      throw CircuitOpenError(name_, kind);
    }

    total_calls_++;
    const int attempts = config_.max_retry_attempts;
    for (int attempt = 0; attempt < attempts; ++attempt) {
      total_attempts_++;
      try {
        using Result =
            std::invoke_result_t<Func &, const CancellationTokenPtr &>;
        if constexpr (std::is_void_v<Result>) {
          runWithTimeout(scheduler_, operation, config_.timeout, cancel);
          onCallSucceeded();
          return;
        } else {
          Result result =
              runWithTimeout(scheduler_, operation, config_.timeout, cancel);
          onCallSucceeded();
          return result;
        }
      } catch (const OperationCancelled &) {
        throw;
      } catch (const CircuitOpenError &) {
        // A nested breaker fast-failed; never retried
        throw;
      } catch (const std::exception &e) {
        if (!retryAfterFailure(attempt, kind, e.what(), cancel)) {
          throw;
        }
      } catch (...) {
        if (!retryAfterFailure(attempt, kind, "non-standard exception",
                               cancel)) {
          throw;
        }
      }
    }

    throw std::logic_error("CircuitBreaker retry loop exited without result");
  }

  /**
   * @brief Whether a call may proceed now
   *
   * An OPEN breaker whose recovery_timeout has elapsed since the last
   * failure moves to HALF_OPEN (resetting success_count) and allows the call.
   */
  bool isCallAllowed();

  /**
   * @brief HALF_OPEN: count towards closing. CLOSED: forgive one failure.
   */
  void recordSuccess();

  /**
   * @brief Count a failure of the given kind; may open the breaker
   */
  void recordFailure(const std::string &kind);

  /**
   * @brief Delay slept after the failed attempt with 0-based index attempt
   * @return min(base_delay * 2^attempt, max_delay)
   */
  std::chrono::milliseconds backoffDelay(int attempt) const;

  State getState() const;

  struct Stats {
    State state;
    size_t failure_count;
    size_t success_count;
    size_t total_calls;
    size_t successful_calls;
    size_t failed_calls;
    size_t rejected_calls;
    size_t total_attempts;
    std::optional<IScheduler::TimePoint> last_failure;
    std::optional<IScheduler::TimePoint> last_success;
  };

  Stats getStats() const;

  /**
   * @brief Failures per operation kind since construction
   */
  std::map<std::string, size_t> getFailureHistory() const;

  /**
   * @brief Force CLOSED and zero the counters; the failure history is kept
   */
  void reset();

  const std::string &name() const { return name_; }
  const CircuitBreakerConfig &config() const { return config_; }

  static const char *stateToString(State state);

private:
  /**
   * @brief Handle a failed attempt of call()
   *
   * On the last attempt the failure is recorded and false is returned so the
   * caller rethrows. Otherwise sleeps the backoff delay and returns true.
   *
   * @throws OperationCancelled if cancel interrupts the backoff sleep
   */
  bool retryAfterFailure(int attempt, const std::string &kind,
                         const std::string &error,
                         const CancellationTokenPtr &cancel);
  void onCallSucceeded();
  void setStateLocked(State new_state);

  const std::string name_;
  const CircuitBreakerConfig config_;
  IScheduler &scheduler_;

  mutable std::mutex mutex_;
  State state_ = State::Closed;
  size_t failure_count_ = 0;
  size_t success_count_ = 0;
  std::optional<IScheduler::TimePoint> last_failure_time_;
  std::optional<IScheduler::TimePoint> last_success_time_;
  std::map<std::string, size_t> failure_history_;

  std::atomic<size_t> total_calls_{0};
  std::atomic<size_t> successful_calls_{0};
  std::atomic<size_t> failed_calls_{0};
  std::atomic<size_t> rejected_calls_{0};
  std::atomic<size_t> total_attempts_{0};
};
