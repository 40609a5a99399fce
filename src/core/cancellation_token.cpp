#include "core/cancellation_token.h"

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(cv_mutex_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(cv_mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return cancelled_.load(); });
}
