#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

/**
 * @brief Cooperative cancellation flag
 *
 * Shared between a caller and the operations it started. Operations poll
 * isCancelled() or block in waitFor(), which wakes up as soon as cancel() is
 * called.
 */
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  /**
   * @brief Request cancellation and wake up every waiter
   */
  void cancel();

  bool isCancelled() const { return cancelled_.load(); }

  /**
   * @brief Block up to timeout or until cancelled
   * @return true if the token was cancelled
   */
  bool waitFor(std::chrono::milliseconds timeout) const;

private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex cv_mutex_;
  mutable std::condition_variable cv_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;
