#pragma once

#include "core/scheduler.h"
#include "core/service_health.h"
#include <chrono>
#include <json/json.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Admit/deny verdict handed to the connection gateway
 *
 * reason is empty when allowed and names the unavailable critical services
 * (or the degraded-count policy) when denied.
 */
struct AdmissionDecision {
  bool allowed = false;
  std::optional<std::string> reason;
};

/**
 * @brief Structured health snapshot served by the monitoring endpoint
 */
struct HealthReport {
  struct ServiceEntry {
    bool available = false;
    ServiceStatus status = ServiceStatus::Unknown;
    std::optional<IScheduler::WallTimePoint> last_check;
    std::optional<std::string> error;
    std::optional<std::chrono::milliseconds> response_time;
    bool circuit_breaker_open = false;
  };

  struct Summary {
    size_t total_services = 0;
    size_t critical_count = 0;
    size_t optional_count = 0;
    size_t healthy_count = 0;
    size_t degraded_count = 0;
    size_t failed_count = 0;
    size_t unknown_count = 0;
    std::vector<std::string> degraded_services;
    std::vector<std::string> failed_services;
  };

  // "healthy", "degraded" or "unhealthy"
  std::string overall_status;
  bool allow_connections = false;
  std::optional<std::string> denial_reason;
  std::optional<IScheduler::WallTimePoint> last_check;
  std::map<std::string, ServiceEntry> critical_services;
  std::map<std::string, ServiceEntry> optional_services;
  Summary summary;

  /**
   * @brief Serialize with the camelCase field names of the health endpoint
   */
  Json::Value toJson() const;
};

/**
 * @brief ISO 8601 UTC timestamp with milliseconds, e.g.
 * 2025-01-31T12:00:00.000Z
 */
std::string formatTimestamp(IScheduler::WallTimePoint time);
