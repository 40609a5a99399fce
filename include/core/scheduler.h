#pragma once

#include "core/cancellation_token.h"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

/**
 * @brief Clock and scheduling abstraction
 *
 * Supplies "now", cancellable sleeps and timeout-bounded execution. Both the
 * circuit breaker and the availability manager go through this interface so
 * tests can drive them with a deterministic clock.
 */
class IScheduler {
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using WallTimePoint = std::chrono::system_clock::time_point;
  using Task = std::function<void(const CancellationTokenPtr &)>;

  virtual ~IScheduler() = default;

  /**
   * @brief Monotonic time used for every elapsed-time decision
   */
  virtual TimePoint now() const = 0;

  /**
   * @brief Wall-clock time, used only for reporting timestamps
   */
  virtual WallTimePoint wallNow() const = 0;

  /**
   * @brief Sleep for the given duration
   * @param duration Time to sleep
   * @param cancel Optional token that interrupts the sleep
   * @return false if the sleep was interrupted by cancellation
   */
  virtual bool sleepFor(std::chrono::milliseconds duration,
                        const CancellationTokenPtr &cancel = nullptr) = 0;

  /**
   * @brief Run task bounded by timeout
   *
   * The task receives a shared token that is cancelled when the timeout
   * expires or the caller's token is cancelled. The task may hand that token
   * on to nested work (e.g. CircuitBreaker::call) so the whole chain stops
   * together. A task that does not return in time is abandoned; it must not
   * reference caller stack state.
   *
   * @throws OperationTimeout if the timeout expires first
   * @throws OperationCancelled if cancel is signalled first
   * @throws whatever the task throws
   */
  virtual void runWithTimeout(Task task, std::chrono::milliseconds timeout,
                              const CancellationTokenPtr &cancel = nullptr) = 0;
};

/**
 * @brief Production scheduler backed by steady_clock and worker threads
 */
class SystemScheduler : public IScheduler {
public:
  SystemScheduler() = default;
  SystemScheduler(const SystemScheduler &) = delete;
  SystemScheduler &operator=(const SystemScheduler &) = delete;

  /**
   * @brief Waits (up to DRAIN_TIMEOUT) for abandoned tasks to return
   *
   * Abandoned tasks have had their token cancelled and may still call back
   * into this scheduler through a CircuitBreaker.
   */
  ~SystemScheduler() override;

  TimePoint now() const override;
  WallTimePoint wallNow() const override;
  bool sleepFor(std::chrono::milliseconds duration,
                const CancellationTokenPtr &cancel = nullptr) override;
  void runWithTimeout(Task task, std::chrono::milliseconds timeout,
                      const CancellationTokenPtr &cancel = nullptr) override;

  /**
   * @brief Tasks started by runWithTimeout() that have not returned yet
   */
  size_t runningTasks() const;

private:
  struct Workers {
    std::mutex mutex;
    std::condition_variable idle;
    size_t running = 0;
  };

  // Granularity at which a waiting caller notices its own cancellation
  static constexpr std::chrono::milliseconds POLL_SLICE{20};
  static constexpr std::chrono::milliseconds DRAIN_TIMEOUT{5000};

  // Shared with the detached workers, which may outlive the wait above
  std::shared_ptr<Workers> workers_ = std::make_shared<Workers>();
};

/**
 * @brief Typed wrapper around IScheduler::runWithTimeout
 *
 * operation is invoked as operation(const CancellationTokenPtr &) and its
 * result (or exception) is handed back to the caller.
 */
template <typename Func>
auto runWithTimeout(IScheduler &scheduler, Func operation,
                    std::chrono::milliseconds timeout,
                    const CancellationTokenPtr &cancel = nullptr)
    -> std::invoke_result_t<Func &, const CancellationTokenPtr &> {
  using Result = std::invoke_result_t<Func &, const CancellationTokenPtr &>;

  if constexpr (std::is_void_v<Result>) {
    scheduler.runWithTimeout(
        [operation](const CancellationTokenPtr &token) mutable {
          operation(token);
        },
        timeout, cancel);
  } else {
    auto result = std::make_shared<std::optional<Result>>();
    scheduler.runWithTimeout(
        [operation, result](const CancellationTokenPtr &token) mutable {
          result->emplace(operation(token));
        },
        timeout, cancel);
    return std::move(**result);
  }
}
