#include "config/resilience_config.h"
#include "core/env_config.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <plog/Log.h>
#include <stdexcept>

namespace {

std::chrono::milliseconds readMs(const Json::Value &json, const char *key,
                                 std::chrono::milliseconds fallback) {
  if (!json.isMember(key)) {
    return fallback;
  }
  if (!json[key].isIntegral()) {
    throw std::invalid_argument(std::string(key) + " must be an integer");
  }
  return std::chrono::milliseconds(json[key].asInt64());
}

int readInt(const Json::Value &json, const char *key, int fallback) {
  if (!json.isMember(key)) {
    return fallback;
  }
  if (!json[key].isInt()) {
    throw std::invalid_argument(std::string(key) + " must be an integer");
  }
  return json[key].asInt();
}

} // namespace

ResilienceConfig::ResilienceConfig()
    : environment_(EnvConfig::getEnvironmentTag()),
      circuit_breaker_(CircuitBreakerConfig::forEnvironment(environment_)),
      availability_(AvailabilityConfig::fromEnv()) {
  applyServerEnvOverrides();
}

bool ResilienceConfig::loadFromFile(const std::string &configPath) {
  try {
    if (!std::filesystem::exists(configPath)) {
      PLOG_WARNING << "[ResilienceConfig] Config file not found: "
                   << configPath << ", using defaults for '" << environment_
                   << "'";
      return loadFromJson(Json::Value(Json::objectValue));
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
      PLOG_ERROR << "[ResilienceConfig] Failed to open config file: "
                 << configPath;
      return false;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
      PLOG_ERROR << "[ResilienceConfig] Failed to parse config file: "
                 << errors;
      return false;
    }

    if (!loadFromJson(root)) {
      return false;
    }
    PLOG_INFO << "[ResilienceConfig] Loaded config from: " << configPath;
    return true;
  } catch (const std::exception &e) {
    PLOG_ERROR << "[ResilienceConfig] Exception loading config: " << e.what();
    return false;
  }
}

bool ResilienceConfig::loadFromJson(const Json::Value &root) {
  if (!root.isObject()) {
    PLOG_ERROR << "[ResilienceConfig] Config root must be an object";
    return false;
  }

  try {
    std::string environment = root.get("environment", "development").asString();
    if (std::getenv("ENVIRONMENT")) {
      environment = EnvConfig::getEnvironmentTag();
    }

    CircuitBreakerConfig circuit_breaker =
        parseCircuitBreaker(root["circuit_breaker"],
                            CircuitBreakerConfig::forEnvironment(environment));
    circuit_breaker.validate();

    AvailabilityConfig availability = AvailabilityConfig::fromEnv(
        parseAvailability(root["availability"], AvailabilityConfig{}));
    availability.validate();

    ServerConfig server;
    const Json::Value &server_json = root["server"];
    if (server_json.isObject()) {
      server.host = server_json.get("host", server.host).asString();
      int port = readInt(server_json, "port", server.port);
      if (port <= 0 || port > 65535) {
        throw std::invalid_argument("server.port out of range");
      }
      server.port = static_cast<uint16_t>(port);
      int threads = readInt(server_json, "threads",
                            static_cast<int>(server.threads));
      if (threads <= 0) {
        throw std::invalid_argument("server.threads must be > 0");
      }
      server.threads = static_cast<size_t>(threads);
    }

    std::vector<ProbeConfig> probes = parseProbes(root["probes"]);

    environment_ = environment;
    circuit_breaker_ = circuit_breaker;
    availability_ = availability;
    server_ = server;
    probes_ = std::move(probes);
    applyServerEnvOverrides();
    return true;
  } catch (const std::exception &e) {
    PLOG_ERROR << "[ResilienceConfig] Invalid configuration: " << e.what();
    return false;
  }
}

CircuitBreakerConfig
ResilienceConfig::parseCircuitBreaker(const Json::Value &json,
                                      CircuitBreakerConfig base) {
  if (json.isNull()) {
    return base;
  }
  if (!json.isObject()) {
    throw std::invalid_argument("circuit_breaker must be an object");
  }

  base.failure_threshold =
      readInt(json, "failure_threshold", base.failure_threshold);
  base.success_threshold =
      readInt(json, "success_threshold", base.success_threshold);
  base.max_retry_attempts =
      readInt(json, "max_retry_attempts", base.max_retry_attempts);
  base.recovery_timeout =
      readMs(json, "recovery_timeout_ms", base.recovery_timeout);
  base.base_delay = readMs(json, "base_delay_ms", base.base_delay);
  base.max_delay = readMs(json, "max_delay_ms", base.max_delay);
  base.timeout = readMs(json, "timeout_ms", base.timeout);
  return base;
}

AvailabilityConfig
ResilienceConfig::parseAvailability(const Json::Value &json,
                                    AvailabilityConfig base) {
  if (json.isNull()) {
    return base;
  }
  if (!json.isObject()) {
    throw std::invalid_argument("availability must be an object");
  }

  base.max_consecutive_failures = readInt(json, "max_consecutive_failures",
                                          base.max_consecutive_failures);
  base.circuit_breaker_timeout = readMs(json, "circuit_breaker_timeout_ms",
                                        base.circuit_breaker_timeout);
  base.health_check_interval =
      readMs(json, "health_check_interval_ms", base.health_check_interval);
  base.degraded_threshold =
      readInt(json, "degraded_threshold", base.degraded_threshold);
  base.probe_timeout = readMs(json, "probe_timeout_ms", base.probe_timeout);
  return base;
}

std::vector<ResilienceConfig::ProbeConfig>
ResilienceConfig::parseProbes(const Json::Value &json) {
  std::vector<ProbeConfig> probes;
  if (json.isNull()) {
    return probes;
  }
  if (!json.isArray()) {
    throw std::invalid_argument("probes must be an array");
  }

  for (const auto &entry : json) {
    const std::string name = entry.get("service", "").asString();
    auto service = serviceTypeFromString(name);
    if (!service) {
      throw std::invalid_argument("Unknown service in probes: '" + name + "'");
    }

    ProbeConfig probe;
    probe.service = *service;
    probe.endpoint.host = entry.get("host", "127.0.0.1").asString();
    int port = readInt(entry, "port", 0);
    if (port <= 0 || port > 65535) {
      throw std::invalid_argument("Probe port out of range for " + name);
    }
    probe.endpoint.port = static_cast<uint16_t>(port);
    probe.slow_threshold =
        readMs(entry, "slow_threshold_ms", probe.slow_threshold);

    auto duplicate = std::find_if(
        probes.begin(), probes.end(),
        [&probe](const ProbeConfig &p) { return p.service == probe.service; });
    if (duplicate != probes.end()) {
      throw std::invalid_argument("Duplicate probe for " + name);
    }
    probes.push_back(probe);
  }
  return probes;
}

void ResilienceConfig::applyServerEnvOverrides() {
  server_.host = EnvConfig::getString("SERVER_HOST", server_.host);
  server_.port = static_cast<uint16_t>(
      EnvConfig::getInt("SERVER_PORT", server_.port, 1, 65535));
  server_.threads = static_cast<size_t>(EnvConfig::getInt(
      "SERVER_THREADS", static_cast<int>(server_.threads), 1, 256));
}
