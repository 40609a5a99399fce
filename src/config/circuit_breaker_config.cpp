#include "config/circuit_breaker_config.h"
#include "core/env_config.h"
#include <algorithm>
#include <plog/Log.h>
#include <stdexcept>

using std::chrono::milliseconds;

void CircuitBreakerConfig::validate() const {
  if (failure_threshold <= 0) {
    throw std::invalid_argument("failure_threshold must be > 0");
  }
  if (success_threshold <= 0) {
    throw std::invalid_argument("success_threshold must be > 0");
  }
  if (max_retry_attempts < 1) {
    throw std::invalid_argument("max_retry_attempts must be >= 1");
  }
  if (recovery_timeout.count() <= 0) {
    throw std::invalid_argument("recovery_timeout must be > 0");
  }
  if (base_delay.count() <= 0) {
    throw std::invalid_argument("base_delay must be > 0");
  }
  if (max_delay.count() <= 0) {
    throw std::invalid_argument("max_delay must be > 0");
  }
  if (timeout.count() <= 0) {
    throw std::invalid_argument("timeout must be > 0");
  }
  if (base_delay > max_delay) {
    throw std::invalid_argument("base_delay must not exceed max_delay");
  }
}

CircuitBreakerConfig
CircuitBreakerConfig::forEnvironment(const std::string &environment) {
  CircuitBreakerConfig config;
  config.success_threshold = 2;

  if (environment == "staging") {
    config.failure_threshold = 3;
    config.recovery_timeout = milliseconds(15000);
    config.max_retry_attempts = 5;
    config.base_delay = milliseconds(500);
    config.max_delay = milliseconds(30000);
    config.timeout = milliseconds(10000);
  } else if (environment == "production") {
    config.failure_threshold = 5;
    config.recovery_timeout = milliseconds(60000);
    config.max_retry_attempts = 3;
    config.base_delay = milliseconds(2000);
    config.max_delay = milliseconds(120000);
    config.timeout = milliseconds(15000);
  } else {
    if (environment != "development") {
      PLOG_WARNING << "[CircuitBreakerConfig] Unknown environment '"
                   << environment << "', using development preset";
    }
    config.failure_threshold = 10;
    config.recovery_timeout = milliseconds(5000);
    config.max_retry_attempts = 3;
    config.base_delay = milliseconds(100);
    config.max_delay = milliseconds(5000);
    config.timeout = milliseconds(5000);
  }

  return config;
}

CircuitBreakerConfig CircuitBreakerConfig::fromEnvironment() {
  return forEnvironment(EnvConfig::getEnvironmentTag());
}

CircuitBreakerConfig
CircuitBreakerConfig::withinBudget(milliseconds budget) const {
  if (budget.count() <= 0) {
    throw std::invalid_argument("retry budget must be > 0");
  }

  CircuitBreakerConfig bounded = *this;
  for (int attempts = max_retry_attempts; attempts > 1; --attempts) {
    milliseconds backoff{0};
    milliseconds delay = base_delay;
    for (int i = 0; i + 1 < attempts; ++i) {
      backoff += delay;
      delay = std::min(delay * 2, max_delay);
    }
    if (backoff >= budget) {
      continue;
    }

    const milliseconds per_attempt = (budget - backoff) / attempts;
    if (per_attempt.count() > 0) {
      bounded.max_retry_attempts = attempts;
      bounded.timeout = std::min(timeout, per_attempt);
      return bounded;
    }
  }

  bounded.max_retry_attempts = 1;
  bounded.timeout = std::min(timeout, budget);
  return bounded;
}

bool CircuitBreakerConfig::operator==(const CircuitBreakerConfig &other) const {
  return failure_threshold == other.failure_threshold &&
         recovery_timeout == other.recovery_timeout &&
         success_threshold == other.success_threshold &&
         max_retry_attempts == other.max_retry_attempts &&
         base_delay == other.base_delay && max_delay == other.max_delay &&
         timeout == other.timeout;
}
