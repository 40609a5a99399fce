#pragma once

#include <chrono>

/**
 * @brief Tunables of ServiceAvailabilityManager
 */
struct AvailabilityConfig {
  // FAILED updates in a row before a service's own breaker opens
  int max_consecutive_failures = 3;
  // How long a service's breaker stays open
  std::chrono::milliseconds circuit_breaker_timeout{60000};
  // Cached health older than this triggers a new check
  std::chrono::milliseconds health_check_interval{30000};
  // Degraded services at or above this count deny admission
  int degraded_threshold = 3;
  // Per-probe time budget
  std::chrono::milliseconds probe_timeout{5000};

  /**
   * @throws std::invalid_argument naming the offending field
   */
  void validate() const;

  /**
   * @brief Defaults overridden by HEALTH_* environment variables
   *
   * HEALTH_MAX_CONSECUTIVE_FAILURES, HEALTH_BREAKER_TIMEOUT_MS,
   * HEALTH_CHECK_INTERVAL_MS, HEALTH_DEGRADED_THRESHOLD,
   * HEALTH_PROBE_TIMEOUT_MS
   */
  static AvailabilityConfig fromEnv(const AvailabilityConfig &base);
  static AvailabilityConfig fromEnv();
};
