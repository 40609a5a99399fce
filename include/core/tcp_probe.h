#pragma once

#include "core/cancellation_token.h"
#include "core/circuit_breaker.h"
#include "core/service_health.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

/**
 * @brief host:port of a dependency reachable over TCP
 */
struct TcpEndpoint {
  std::string host;
  uint16_t port = 0;

  std::string toString() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief Open and close a TCP connection to endpoint
 *
 * @param endpoint Target; host may be a name or a numeric address
 * @param timeout Connect budget
 * @param token Aborts the wait when cancelled
 * @throws ProbeError if resolution or connection fails, times out or is
 * cancelled
 */
void tcpConnect(const TcpEndpoint &endpoint, std::chrono::milliseconds timeout,
                const CancellationToken &token);

/**
 * @brief Health probe that reports a dependency by TCP reachability
 *
 * Connections slower than slow_threshold report DEGRADED. When breaker is
 * given, the connect goes through breaker->call() and gains its retries and
 * fast-fail.
 */
HealthProbe makeTcpProbe(TcpEndpoint endpoint,
                         std::chrono::milliseconds connect_timeout,
                         std::chrono::milliseconds slow_threshold,
                         std::shared_ptr<CircuitBreaker> breaker = nullptr);
