#pragma once

#include <chrono>
#include <string>

/**
 * @brief Immutable configuration of one CircuitBreaker
 *
 * All numeric fields must be strictly positive and base_delay must not
 * exceed max_delay; validate() enforces this.
 */
struct CircuitBreakerConfig {
  int failure_threshold = 5;
  std::chrono::milliseconds recovery_timeout{60000};
  int success_threshold = 2;
  int max_retry_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{30000};
  std::chrono::milliseconds timeout{10000};

  /**
   * @throws std::invalid_argument naming the offending field
   */
  void validate() const;

  /**
   * @brief Preset for a deployment environment
   * @param environment "staging", "production" or "development"; anything
   * else falls back to development with a warning
   */
  static CircuitBreakerConfig forEnvironment(const std::string &environment);

  /**
   * @brief Preset selected by the ENVIRONMENT variable
   */
  static CircuitBreakerConfig fromEnvironment();

  /**
   * @brief Copy whose whole retry sequence fits in budget
   *
   * The worst case of a call is max_retry_attempts timeouts plus the backoff
   * sleeps between them. Attempts are kept where possible and the
   * per-attempt timeout is shortened to share what the backoff leaves;
   * attempts are dropped only when the backoff alone would exceed budget.
   *
   * @throws std::invalid_argument if budget is not positive
   */
  CircuitBreakerConfig withinBudget(std::chrono::milliseconds budget) const;

  bool operator==(const CircuitBreakerConfig &other) const;
  bool operator!=(const CircuitBreakerConfig &other) const {
    return !(*this == other);
  }
};
