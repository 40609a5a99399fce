#pragma once

#include "core/cancellation_token.h"
#include "core/scheduler.h"
#include <array>
#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>

/**
 * @brief Dependencies monitored before admitting a realtime connection
 */
enum class ServiceType {
  AuthService,
  Database,
  Redis,
  WebSocketBridge,
  AgentSupervisor,
  ToolDispatcher,
  ThreadService
};

constexpr std::array<ServiceType, 7> ALL_SERVICE_TYPES = {
    ServiceType::AuthService,     ServiceType::Database,
    ServiceType::Redis,           ServiceType::WebSocketBridge,
    ServiceType::AgentSupervisor, ServiceType::ToolDispatcher,
    ServiceType::ThreadService};

/**
 * @brief Stable snake_case identifier, e.g. "auth_service"
 */
const char *serviceTypeToString(ServiceType type);

std::optional<ServiceType> serviceTypeFromString(const std::string &name);

enum class ServiceStatus { Unknown, Healthy, Degraded, Failed };

const char *serviceStatusToString(ServiceStatus status);

/**
 * @brief Health record of one service, owned by ServiceAvailabilityManager
 */
struct ServiceHealthInfo {
  ServiceType service = ServiceType::AuthService;
  ServiceStatus status = ServiceStatus::Unknown;
  std::optional<IScheduler::TimePoint> last_check;
  std::optional<std::string> error_message;
  std::optional<std::chrono::milliseconds> response_time;
  int consecutive_failures = 0;
  bool circuit_breaker_open = false;
  std::optional<IScheduler::TimePoint> circuit_breaker_until;
};

/**
 * @brief Partition of every ServiceType into critical and optional
 */
struct ServiceDependencyMap {
  std::set<ServiceType> critical;
  std::set<ServiceType> optional;

  /**
   * @brief auth_service and database are critical, the rest optional
   */
  static ServiceDependencyMap defaults();

  bool isCritical(ServiceType type) const { return critical.count(type) > 0; }

  /**
   * @throws std::invalid_argument unless critical and optional are disjoint
   * and together cover every ServiceType
   */
  void validate() const;
};

/**
 * @brief Outcome reported by a probe that returned normally
 *
 * A probe that throws or exceeds its time budget is recorded as FAILED.
 */
struct ProbeResult {
  ServiceStatus status = ServiceStatus::Healthy;
  std::string message;

  static ProbeResult healthy() { return {ServiceStatus::Healthy, ""}; }
  static ProbeResult degraded(std::string why) {
    return {ServiceStatus::Degraded, std::move(why)};
  }
};

/**
 * @brief Health check strategy registered per ServiceType
 *
 * Runs on a worker thread and may be abandoned on timeout, so it must
 * capture its state by value and should return early once the token is
 * cancelled.
 */
using HealthProbe = std::function<ProbeResult(const CancellationTokenPtr &)>;
