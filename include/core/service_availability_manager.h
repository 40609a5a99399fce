#pragma once

#include "config/availability_config.h"
#include "core/cancellation_token.h"
#include "core/health_report.h"
#include "core/scheduler.h"
#include "core/service_health.h"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Aggregates dependency health into a connection admission decision
 *
 * Owns one ServiceHealthInfo per ServiceType. Registered probes are run
 * concurrently by checkAllServices(); each service also carries its own
 * failure-streak breaker so a known-bad dependency is not re-probed on every
 * admission check. Critical services block admission when unavailable;
 * degraded services block it only once degraded_threshold is reached.
 *
 * Constructed once at startup and passed by reference to every consumer.
 * All public methods are thread-safe.
 */
class ServiceAvailabilityManager {
public:
  /**
   * @param scheduler Clock and probe timeouts
   * @param config Validated on construction
   * @param dependencies Critical/optional partition, validated on construction
   * @throws std::invalid_argument on invalid config or dependencies
   */
  ServiceAvailabilityManager(
      IScheduler &scheduler, AvailabilityConfig config = {},
      ServiceDependencyMap dependencies = ServiceDependencyMap::defaults());

  ServiceAvailabilityManager(const ServiceAvailabilityManager &) = delete;
  ServiceAvailabilityManager &
  operator=(const ServiceAvailabilityManager &) = delete;

  /**
   * @brief Associate a health probe with a service, replacing any previous
   * @throws std::invalid_argument if probe is empty
   */
  void registerProbe(ServiceType service, HealthProbe probe);

  bool hasProbe(ServiceType service) const;

  /**
   * @brief Run every registered probe concurrently and apply the results
   *
   * Services whose own breaker is open and not yet expired are skipped.
   * A probe that throws or times out is recorded as FAILED; no probe error
   * escapes. All results are applied together once every probe finished.
   *
   * @param cancel Optional caller token
   * @return Snapshot of every service record after the update
   * @throws OperationCancelled if cancel was signalled; nothing is applied
   * and admission is denied until the next completed check
   */
  std::map<ServiceType, ServiceHealthInfo>
  checkAllServices(const CancellationTokenPtr &cancel = nullptr);

  /**
   * @brief Record a health observation for one service
   *
   * FAILED extends the failure streak, anything else resets it. Reaching
   * max_consecutive_failures opens the service's breaker for
   * circuit_breaker_timeout; a HEALTHY observation after expiry closes it.
   */
  void updateServiceHealth(
      ServiceType service, ServiceStatus status,
      std::optional<std::string> error_message = std::nullopt,
      std::optional<std::chrono::milliseconds> response_time = std::nullopt);

  /**
   * @brief Whether the service can currently be relied on
   *
   * With its breaker open, a service becomes available again once the
   * breaker timeout has elapsed (probe opportunity).
   */
  bool isServiceAvailable(ServiceType service) const;

  bool areCriticalServicesAvailable() const;

  std::vector<ServiceType> getDegradedServices() const;
  std::vector<ServiceType> getFailedServices() const;

  std::optional<ServiceHealthInfo> getServiceHealth(ServiceType service) const;

  /**
   * @brief Admission decision for a new realtime connection
   *
   * Refreshes the cached health first when it is stale.
   */
  AdmissionDecision shouldAllowConnection();

  /**
   * @brief Health snapshot; refreshes first when the cache is stale
   *
   * If cancel fires during the refresh, the returned report reflects the
   * fail-safe state: connections denied because health is unknown.
   */
  HealthReport getHealthReport(const CancellationTokenPtr &cancel = nullptr);

  /**
   * @brief True before the first check and once health_check_interval has
   * passed since the last completed check
   */
  bool isHealthStale() const;

  const AvailabilityConfig &config() const { return config_; }
  const ServiceDependencyMap &dependencies() const { return dependencies_; }

private:
  struct ProbeOutcome {
    ServiceType service;
    ServiceStatus status;
    std::optional<std::string> error_message;
    std::optional<std::chrono::milliseconds> response_time;
    bool cancelled = false;
  };

  ProbeOutcome runProbe(ServiceType service, const HealthProbe &probe,
                        const CancellationTokenPtr &cancel);
  void refreshIfStale(const CancellationTokenPtr &cancel);

  void applyUpdateLocked(ServiceType service, ServiceStatus status,
                         std::optional<std::string> error_message,
                         std::optional<std::chrono::milliseconds> response_time);
  bool isServiceAvailableLocked(ServiceType service) const;
  bool isHealthStaleLocked() const;
  std::vector<ServiceType> servicesWithStatusLocked(ServiceStatus status) const;
  AdmissionDecision decideLocked() const;
  HealthReport buildReportLocked() const;
  IScheduler::WallTimePoint toWallTime(IScheduler::TimePoint time) const;

  IScheduler &scheduler_;
  const AvailabilityConfig config_;
  const ServiceDependencyMap dependencies_;

  mutable std::mutex probes_mutex_;
  std::map<ServiceType, HealthProbe> probes_;

  mutable std::mutex health_mutex_;
  std::map<ServiceType, ServiceHealthInfo> health_;
  std::optional<IScheduler::TimePoint> last_global_check_;
  // Set when the latest check was cancelled; admission fails safe
  bool health_unknown_ = false;
};
