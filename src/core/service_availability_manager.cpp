#include "core/service_availability_manager.h"
#include "core/resilience_errors.h"
#include <future>
#include <plog/Log.h>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

std::string joinServiceNames(const std::vector<ServiceType> &services) {
  std::ostringstream oss;
  for (size_t i = 0; i < services.size(); ++i) {
    if (i > 0) {
      oss << ", ";
    }
    oss << serviceTypeToString(services[i]);
  }
  return oss.str();
}

} // namespace

ServiceAvailabilityManager::ServiceAvailabilityManager(
    IScheduler &scheduler, AvailabilityConfig config,
    ServiceDependencyMap dependencies)
    : scheduler_(scheduler), config_(std::move(config)),
      dependencies_(std::move(dependencies)) {
  config_.validate();
  dependencies_.validate();

  for (ServiceType type : ALL_SERVICE_TYPES) {
    ServiceHealthInfo info;
    info.service = type;
    health_[type] = info;
  }

  PLOG_INFO << "[ServiceAvailability] Monitoring " << health_.size()
            << " services (" << dependencies_.critical.size()
            << " critical), check interval "
            << config_.health_check_interval.count() << "ms";
}

void ServiceAvailabilityManager::registerProbe(ServiceType service,
                                               HealthProbe probe) {
  if (!probe) {
    throw std::invalid_argument(std::string("Empty health probe for ") +
                                serviceTypeToString(service));
  }
  std::lock_guard<std::mutex> lock(probes_mutex_);
  probes_[service] = std::move(probe);
  PLOG_DEBUG << "[ServiceAvailability] Probe registered for "
             << serviceTypeToString(service);
}

bool ServiceAvailabilityManager::hasProbe(ServiceType service) const {
  std::lock_guard<std::mutex> lock(probes_mutex_);
  return probes_.count(service) > 0;
}

std::map<ServiceType, ServiceHealthInfo>
ServiceAvailabilityManager::checkAllServices(
    const CancellationTokenPtr &cancel) {
  std::map<ServiceType, HealthProbe> probes;
  {
    std::lock_guard<std::mutex> lock(probes_mutex_);
    probes = probes_;
  }

  // Skip services whose own breaker is still open
  {
    std::lock_guard<std::mutex> lock(health_mutex_);
    const auto now = scheduler_.now();
    for (auto it = probes.begin(); it != probes.end();) {
      const ServiceHealthInfo &info = health_.at(it->first);
      if (info.circuit_breaker_open && info.circuit_breaker_until &&
          now < *info.circuit_breaker_until) {
        PLOG_DEBUG << "[ServiceAvailability] Skipping "
                   << serviceTypeToString(it->first)
                   << " probe, breaker open";
        it = probes.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::vector<std::future<ProbeOutcome>> pending;
  pending.reserve(probes.size());
  for (const auto &[service, probe] : probes) {
    pending.push_back(std::async(std::launch::async,
                                 [this, service = service, probe = probe,
                                  cancel]() {
                                   return runProbe(service, probe, cancel);
                                 }));
  }

  // Each probe is bounded by probe_timeout, so every get() returns in time
  std::vector<ProbeOutcome> outcomes;
  outcomes.reserve(pending.size());
  for (auto &future : pending) {
    outcomes.push_back(future.get());
  }

  std::lock_guard<std::mutex> lock(health_mutex_);
  if (cancel && cancel->isCancelled()) {
    health_unknown_ = true;
    last_global_check_.reset();
    PLOG_WARNING << "[ServiceAvailability] Health check cancelled, "
                    "admission denied until the next completed check";
    throw OperationCancelled("Health check cancelled");
  }

  for (auto &outcome : outcomes) {
    applyUpdateLocked(outcome.service, outcome.status,
                      std::move(outcome.error_message), outcome.response_time);
  }
  last_global_check_ = scheduler_.now();
  health_unknown_ = false;

  PLOG_DEBUG << "[ServiceAvailability] Checked " << outcomes.size()
             << " service(s)";
  return health_;
}

ServiceAvailabilityManager::ProbeOutcome
ServiceAvailabilityManager::runProbe(ServiceType service,
                                     const HealthProbe &probe,
                                     const CancellationTokenPtr &cancel) {
  ProbeOutcome outcome{service, ServiceStatus::Failed, std::nullopt,
                       std::nullopt, false};
  const auto started = scheduler_.now();

  try {
    ProbeResult result =
        runWithTimeout(scheduler_, probe, config_.probe_timeout, cancel);
    outcome.response_time =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            scheduler_.now() - started);

    switch (result.status) {
    case ServiceStatus::Healthy:
    case ServiceStatus::Degraded:
      outcome.status = result.status;
      if (!result.message.empty()) {
        outcome.error_message = result.message;
      }
      break;
    case ServiceStatus::Failed:
      outcome.status = ServiceStatus::Failed;
      outcome.error_message =
          result.message.empty() ? "Probe reported failure" : result.message;
      break;
    case ServiceStatus::Unknown:
      outcome.status = ServiceStatus::Failed;
      outcome.error_message = "Probe returned unknown status";
      break;
    }
  } catch (const OperationCancelled &e) {
    outcome.cancelled = true;
    outcome.error_message = e.what();
  } catch (const OperationTimeout &e) {
    outcome.error_message = std::string("Health check timed out: ") + e.what();
  } catch (const std::exception &e) {
    outcome.error_message = e.what();
  } catch (...) {
    outcome.error_message = "Unknown probe error";
  }

  if (outcome.status == ServiceStatus::Failed && !outcome.cancelled) {
    PLOG_WARNING << "[ServiceAvailability] " << serviceTypeToString(service)
                 << " probe failed: " << outcome.error_message.value_or("");
  }
  return outcome;
}

void ServiceAvailabilityManager::updateServiceHealth(
    ServiceType service, ServiceStatus status,
    std::optional<std::string> error_message,
    std::optional<std::chrono::milliseconds> response_time) {
  std::lock_guard<std::mutex> lock(health_mutex_);
  applyUpdateLocked(service, status, std::move(error_message), response_time);
}

void ServiceAvailabilityManager::applyUpdateLocked(
    ServiceType service, ServiceStatus status,
    std::optional<std::string> error_message,
    std::optional<std::chrono::milliseconds> response_time) {
  auto it = health_.find(service);
  if (it == health_.end()) {
    return;
  }

  ServiceHealthInfo &info = it->second;
  const auto now = scheduler_.now();
  const ServiceStatus previous = info.status;

  info.status = status;
  info.last_check = now;
  info.error_message = std::move(error_message);
  info.response_time = response_time;

  if (status == ServiceStatus::Failed) {
    info.consecutive_failures++;
  } else {
    info.consecutive_failures = 0;
  }

  if (info.consecutive_failures >= config_.max_consecutive_failures) {
    if (!info.circuit_breaker_open) {
      PLOG_WARNING << "[ServiceAvailability] " << serviceTypeToString(service)
                   << " breaker opened after " << info.consecutive_failures
                   << " consecutive failures";
    }
    info.circuit_breaker_open = true;
    info.circuit_breaker_until = now + config_.circuit_breaker_timeout;
  }

  if (status == ServiceStatus::Healthy && info.circuit_breaker_open &&
      info.circuit_breaker_until && now >= *info.circuit_breaker_until) {
    info.circuit_breaker_open = false;
    info.circuit_breaker_until.reset();
    PLOG_INFO << "[ServiceAvailability] " << serviceTypeToString(service)
              << " recovered, breaker closed";
  }

  if (previous != status) {
    PLOG_INFO << "[ServiceAvailability] " << serviceTypeToString(service)
              << " " << serviceStatusToString(previous) << " -> "
              << serviceStatusToString(status);
  }
}

bool ServiceAvailabilityManager::isServiceAvailable(ServiceType service) const {
  std::lock_guard<std::mutex> lock(health_mutex_);
  return isServiceAvailableLocked(service);
}

bool ServiceAvailabilityManager::isServiceAvailableLocked(
    ServiceType service) const {
  auto it = health_.find(service);
  if (it == health_.end()) {
    return false;
  }

  const ServiceHealthInfo &info = it->second;
  if (info.circuit_breaker_open) {
    return info.circuit_breaker_until &&
           scheduler_.now() >= *info.circuit_breaker_until;
  }
  return info.status == ServiceStatus::Healthy ||
         info.status == ServiceStatus::Degraded;
}

bool ServiceAvailabilityManager::areCriticalServicesAvailable() const {
  std::lock_guard<std::mutex> lock(health_mutex_);
  for (ServiceType service : dependencies_.critical) {
    if (!isServiceAvailableLocked(service)) {
      return false;
    }
  }
  return true;
}

std::vector<ServiceType> ServiceAvailabilityManager::getDegradedServices() const {
  std::lock_guard<std::mutex> lock(health_mutex_);
  return servicesWithStatusLocked(ServiceStatus::Degraded);
}

std::vector<ServiceType> ServiceAvailabilityManager::getFailedServices() const {
  std::lock_guard<std::mutex> lock(health_mutex_);
  return servicesWithStatusLocked(ServiceStatus::Failed);
}

std::vector<ServiceType>
ServiceAvailabilityManager::servicesWithStatusLocked(ServiceStatus status) const {
  std::vector<ServiceType> services;
  for (const auto &[service, info] : health_) {
    if (info.status == status) {
      services.push_back(service);
    }
  }
  return services;
}

std::optional<ServiceHealthInfo>
ServiceAvailabilityManager::getServiceHealth(ServiceType service) const {
  std::lock_guard<std::mutex> lock(health_mutex_);
  auto it = health_.find(service);
  if (it == health_.end()) {
    return std::nullopt;
  }
  return it->second;
}

AdmissionDecision ServiceAvailabilityManager::shouldAllowConnection() {
  refreshIfStale(nullptr);

  std::lock_guard<std::mutex> lock(health_mutex_);
  AdmissionDecision decision = decideLocked();
  if (!decision.allowed) {
    PLOG_WARNING << "[ServiceAvailability] Connection denied: "
                 << decision.reason.value_or("");
  }
  return decision;
}

AdmissionDecision ServiceAvailabilityManager::decideLocked() const {
  if (health_unknown_) {
    return {false, std::string("service health unknown: the last health "
                               "check was cancelled")};
  }

  std::vector<ServiceType> unavailable;
  for (ServiceType service : dependencies_.critical) {
    if (!isServiceAvailableLocked(service)) {
      unavailable.push_back(service);
    }
  }
  if (!unavailable.empty()) {
    return {false, "critical services unavailable: " +
                       joinServiceNames(unavailable)};
  }

  const std::vector<ServiceType> degraded =
      servicesWithStatusLocked(ServiceStatus::Degraded);
  if (degraded.size() >= static_cast<size_t>(config_.degraded_threshold)) {
    return {false, "too many degraded services (" +
                       std::to_string(degraded.size()) + " >= threshold " +
                       std::to_string(config_.degraded_threshold) +
                       "): " + joinServiceNames(degraded)};
  }

  return {true, std::nullopt};
}

HealthReport
ServiceAvailabilityManager::getHealthReport(const CancellationTokenPtr &cancel) {
  refreshIfStale(cancel);

  std::lock_guard<std::mutex> lock(health_mutex_);
  return buildReportLocked();
}

HealthReport ServiceAvailabilityManager::buildReportLocked() const {
  HealthReport report;
  const AdmissionDecision decision = decideLocked();
  report.allow_connections = decision.allowed;
  report.denial_reason = decision.reason;
  if (last_global_check_) {
    report.last_check = toWallTime(*last_global_check_);
  }

  HealthReport::Summary &summary = report.summary;
  bool all_healthy = true;
  for (const auto &[service, info] : health_) {
    HealthReport::ServiceEntry entry;
    entry.available = isServiceAvailableLocked(service);
    entry.status = info.status;
    if (info.last_check) {
      entry.last_check = toWallTime(*info.last_check);
    }
    entry.error = info.error_message;
    entry.response_time = info.response_time;
    entry.circuit_breaker_open = info.circuit_breaker_open;

    const std::string name = serviceTypeToString(service);
    if (dependencies_.isCritical(service)) {
      report.critical_services[name] = entry;
      summary.critical_count++;
    } else {
      report.optional_services[name] = entry;
      summary.optional_count++;
    }

    switch (info.status) {
    case ServiceStatus::Healthy:
      summary.healthy_count++;
      break;
    case ServiceStatus::Degraded:
      summary.degraded_count++;
      summary.degraded_services.push_back(name);
      break;
    case ServiceStatus::Failed:
      summary.failed_count++;
      summary.failed_services.push_back(name);
      break;
    case ServiceStatus::Unknown:
      summary.unknown_count++;
      break;
    }
    if (info.status != ServiceStatus::Healthy || info.circuit_breaker_open) {
      all_healthy = false;
    }
  }
  summary.total_services = health_.size();

  if (!decision.allowed) {
    report.overall_status = "unhealthy";
  } else if (!all_healthy) {
    report.overall_status = "degraded";
  } else {
    report.overall_status = "healthy";
  }
  return report;
}

bool ServiceAvailabilityManager::isHealthStale() const {
  std::lock_guard<std::mutex> lock(health_mutex_);
  return isHealthStaleLocked();
}

bool ServiceAvailabilityManager::isHealthStaleLocked() const {
  return !last_global_check_ ||
         scheduler_.now() - *last_global_check_ >= config_.health_check_interval;
}

void ServiceAvailabilityManager::refreshIfStale(
    const CancellationTokenPtr &cancel) {
  {
    std::lock_guard<std::mutex> lock(health_mutex_);
    if (!isHealthStaleLocked()) {
      return;
    }
  }

  try {
    checkAllServices(cancel);
  } catch (const OperationCancelled &) {
    // checkAllServices() already recorded the fail-safe state
    PLOG_DEBUG << "[ServiceAvailability] Refresh cancelled, reporting "
                  "unknown health";
  }
}

IScheduler::WallTimePoint
ServiceAvailabilityManager::toWallTime(IScheduler::TimePoint time) const {
  const auto age = std::chrono::duration_cast<std::chrono::system_clock::duration>(
      scheduler_.now() - time);
  return scheduler_.wallNow() - age;
}
