#pragma once

#include "config/availability_config.h"
#include "config/circuit_breaker_config.h"
#include "core/service_health.h"
#include "core/tcp_probe.h"
#include <chrono>
#include <cstdint>
#include <json/json.h>
#include <string>
#include <vector>

/**
 * @brief Startup configuration of the admission server
 *
 * Loaded from a JSON file (see config/resilience.json). The circuit breaker
 * starts from the preset of the selected environment and individual fields
 * may be overridden by the file. Environment variables override the file:
 * ENVIRONMENT, SERVER_HOST, SERVER_PORT, SERVER_THREADS and the HEALTH_*
 * variables read by AvailabilityConfig::fromEnv().
 *
 * Constructed once in main() and passed by value to the components.
 */
class ResilienceConfig {
public:
  struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8765;
    size_t threads = 4;
  };

  struct ProbeConfig {
    ServiceType service = ServiceType::AuthService;
    TcpEndpoint endpoint;
    std::chrono::milliseconds slow_threshold{1000};
  };

  /**
   * @brief Defaults for the ENVIRONMENT preset, no probes
   */
  ResilienceConfig();

  /**
   * @brief Load configuration from file
   *
   * A missing file yields the defaults. On parse or validation errors the
   * defaults are kept and false is returned.
   *
   * @param configPath Path to the JSON file
   * @return true if loaded successfully (or the file does not exist)
   */
  bool loadFromFile(const std::string &configPath);

  /**
   * @brief Apply an already parsed document
   * @return false (and keep the previous values) if the document is invalid
   */
  bool loadFromJson(const Json::Value &root);

  const std::string &environment() const { return environment_; }
  const CircuitBreakerConfig &circuitBreaker() const { return circuit_breaker_; }
  const AvailabilityConfig &availability() const { return availability_; }
  const ServerConfig &server() const { return server_; }
  const std::vector<ProbeConfig> &probes() const { return probes_; }

private:
  static CircuitBreakerConfig parseCircuitBreaker(const Json::Value &json,
                                                  CircuitBreakerConfig base);
  static AvailabilityConfig parseAvailability(const Json::Value &json,
                                              AvailabilityConfig base);
  static std::vector<ProbeConfig> parseProbes(const Json::Value &json);
  void applyServerEnvOverrides();

  std::string environment_;
  CircuitBreakerConfig circuit_breaker_;
  AvailabilityConfig availability_;
  ServerConfig server_;
  std::vector<ProbeConfig> probes_;
};
