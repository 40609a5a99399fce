#include "config/availability_config.h"
#include "core/env_config.h"
#include <stdexcept>

void AvailabilityConfig::validate() const {
  if (max_consecutive_failures <= 0) {
    throw std::invalid_argument("max_consecutive_failures must be > 0");
  }
  if (circuit_breaker_timeout.count() <= 0) {
    throw std::invalid_argument("circuit_breaker_timeout must be > 0");
  }
  if (health_check_interval.count() <= 0) {
    throw std::invalid_argument("health_check_interval must be > 0");
  }
  if (degraded_threshold <= 0) {
    throw std::invalid_argument("degraded_threshold must be > 0");
  }
  if (probe_timeout.count() <= 0) {
    throw std::invalid_argument("probe_timeout must be > 0");
  }
}

AvailabilityConfig AvailabilityConfig::fromEnv(const AvailabilityConfig &base) {
  AvailabilityConfig config = base;
  config.max_consecutive_failures = EnvConfig::getInt(
      "HEALTH_MAX_CONSECUTIVE_FAILURES", base.max_consecutive_failures, 1, 100);
  config.circuit_breaker_timeout = EnvConfig::getMilliseconds(
      "HEALTH_BREAKER_TIMEOUT_MS", base.circuit_breaker_timeout, 100, 3600000);
  config.health_check_interval = EnvConfig::getMilliseconds(
      "HEALTH_CHECK_INTERVAL_MS", base.health_check_interval, 100, 3600000);
  config.degraded_threshold = EnvConfig::getInt(
      "HEALTH_DEGRADED_THRESHOLD", base.degraded_threshold, 1, 100);
  config.probe_timeout = EnvConfig::getMilliseconds(
      "HEALTH_PROBE_TIMEOUT_MS", base.probe_timeout, 10, 600000);
  return config;
}

AvailabilityConfig AvailabilityConfig::fromEnv() {
  return fromEnv(AvailabilityConfig());
}
