#include "core/service_health.h"
#include <stdexcept>

const char *serviceTypeToString(ServiceType type) {
  switch (type) {
  case ServiceType::AuthService:
    return "auth_service";
  case ServiceType::Database:
    return "database";
  case ServiceType::Redis:
    return "redis";
  case ServiceType::WebSocketBridge:
    return "websocket_bridge";
  case ServiceType::AgentSupervisor:
    return "agent_supervisor";
  case ServiceType::ToolDispatcher:
    return "tool_dispatcher";
  case ServiceType::ThreadService:
    return "thread_service";
  }
  return "unknown_service";
}

std::optional<ServiceType> serviceTypeFromString(const std::string &name) {
  for (ServiceType type : ALL_SERVICE_TYPES) {
    if (name == serviceTypeToString(type)) {
      return type;
    }
  }
  return std::nullopt;
}

const char *serviceStatusToString(ServiceStatus status) {
  switch (status) {
  case ServiceStatus::Unknown:
    return "unknown";
  case ServiceStatus::Healthy:
    return "healthy";
  case ServiceStatus::Degraded:
    return "degraded";
  case ServiceStatus::Failed:
    return "failed";
  }
  return "unknown";
}

ServiceDependencyMap ServiceDependencyMap::defaults() {
  ServiceDependencyMap map;
  map.critical = {ServiceType::AuthService, ServiceType::Database};
  map.optional = {ServiceType::Redis, ServiceType::WebSocketBridge,
                  ServiceType::AgentSupervisor, ServiceType::ToolDispatcher,
                  ServiceType::ThreadService};
  return map;
}

void ServiceDependencyMap::validate() const {
  for (ServiceType type : critical) {
    if (optional.count(type) > 0) {
      throw std::invalid_argument(std::string("Service ") +
                                  serviceTypeToString(type) +
                                  " is both critical and optional");
    }
  }
  for (ServiceType type : ALL_SERVICE_TYPES) {
    if (critical.count(type) == 0 && optional.count(type) == 0) {
      throw std::invalid_argument(std::string("Service ") +
                                  serviceTypeToString(type) +
                                  " is neither critical nor optional");
    }
  }
}
