#include "core/circuit_breaker.h"
#include <algorithm>
#include <utility>

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config,
                               IScheduler &scheduler)
    : name_(std::move(name)), config_(std::move(config)),
      scheduler_(scheduler) {
  config_.validate();
  PLOG_DEBUG << "[CircuitBreaker] " << name_
             << " created (failure_threshold=" << config_.failure_threshold
             << ", recovery_timeout=" << config_.recovery_timeout.count()
             << "ms, max_retry_attempts=" << config_.max_retry_attempts << ")";
}

bool CircuitBreaker::isCallAllowed() {
  std::lock_guard<std::mutex> lock(mutex_);

  switch (state_) {
  case State::Closed:
  case State::HalfOpen:
    return true;
  case State::Open:
    break;
  }

  const auto now = scheduler_.now();
  if (last_failure_time_ &&
      now - *last_failure_time_ < config_.recovery_timeout) {
    return false;
  }

  setStateLocked(State::HalfOpen);
  return true;
}

void CircuitBreaker::recordSuccess() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_success_time_ = scheduler_.now();

  if (state_ == State::HalfOpen) {
    success_count_++;
    if (success_count_ >= static_cast<size_t>(config_.success_threshold)) {
      setStateLocked(State::Closed);
      failure_count_ = 0;
    }
  } else if (state_ == State::Closed) {
    // A success forgives one past failure instead of clearing them all
    if (failure_count_ > 0) {
      failure_count_--;
    }
  }
}

void CircuitBreaker::recordFailure(const std::string &kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_count_++;
  failure_history_[kind]++;
  last_failure_time_ = scheduler_.now();

  if (state_ == State::HalfOpen) {
    // Any failure during probation reopens the circuit
    setStateLocked(State::Open);
  } else if (state_ == State::Closed &&
             failure_count_ >= static_cast<size_t>(config_.failure_threshold)) {
    setStateLocked(State::Open);
  }
}

std::chrono::milliseconds CircuitBreaker::backoffDelay(int attempt) const {
  if (attempt < 0) {
    attempt = 0;
  }

  // Stop doubling once capped so large attempt indices cannot overflow
  std::chrono::milliseconds delay = config_.base_delay;
  for (int i = 0; i < attempt && delay < config_.max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.max_delay);
}

CircuitBreaker::State CircuitBreaker::getState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

CircuitBreaker::Stats CircuitBreaker::getStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Stats stats;
  stats.state = state_;
  stats.failure_count = failure_count_;
  stats.success_count = success_count_;
  stats.total_calls = total_calls_.load();
  stats.successful_calls = successful_calls_.load();
  stats.failed_calls = failed_calls_.load();
  stats.rejected_calls = rejected_calls_.load();
  stats.total_attempts = total_attempts_.load();
  stats.last_failure = last_failure_time_;
  stats.last_success = last_success_time_;
  return stats;
}

std::map<std::string, size_t> CircuitBreaker::getFailureHistory() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_history_;
}

void CircuitBreaker::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  setStateLocked(State::Closed);
  failure_count_ = 0;
  success_count_ = 0;
  total_calls_ = 0;
  successful_calls_ = 0;
  failed_calls_ = 0;
  rejected_calls_ = 0;
  total_attempts_ = 0;
}

const char *CircuitBreaker::stateToString(State state) {
  switch (state) {
  case State::Closed:
    return "CLOSED";
  case State::Open:
    return "OPEN";
  case State::HalfOpen:
    return "HALF_OPEN";
  }
  return "UNKNOWN";
}

bool CircuitBreaker::retryAfterFailure(int attempt, const std::string &kind,
                                       const std::string &error,
                                       const CancellationTokenPtr &cancel) {
  const int attempts = config_.max_retry_attempts;
  if (attempt + 1 >= attempts) {
    PLOG_WARNING << "[CircuitBreaker] " << name_ << " " << kind
                 << " failed after " << attempts << " attempt(s): " << error;
    failed_calls_++;
    recordFailure(kind);
    return false;
  }

  const std::chrono::milliseconds delay = backoffDelay(attempt);
  PLOG_DEBUG << "[CircuitBreaker] " << name_ << " " << kind << " attempt "
             << (attempt + 1) << "/" << attempts << " failed (" << error
             << "), retrying in " << delay.count() << "ms";
  if (!scheduler_.sleepFor(delay, cancel)) {
    throw OperationCancelled("Retry of " + kind + " cancelled");
  }
  return true;
}

void CircuitBreaker::onCallSucceeded() {
  successful_calls_++;
  recordSuccess();
}

void CircuitBreaker::setStateLocked(State new_state) {
  if (new_state == state_) {
    return;
  }

  if (new_state == State::Open) {
    PLOG_WARNING << "[CircuitBreaker] " << name_ << " "
                 << stateToString(state_) << " -> OPEN (failures="
                 << failure_count_ << ")";
  } else {
    PLOG_INFO << "[CircuitBreaker] " << name_ << " " << stateToString(state_)
              << " -> " << stateToString(new_state);
  }

  state_ = new_state;
  if (new_state == State::HalfOpen || new_state == State::Open) {
    // Probation always starts from zero successes
    success_count_ = 0;
  }
}
