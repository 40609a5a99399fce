#include "api/admission_websocket.h"
#include "api/service_health_handler.h"
#include "config/resilience_config.h"
#include "core/circuit_breaker.h"
#include "core/env_config.h"
#include "core/health_refresher.h"
#include "core/logger.h"
#include "core/scheduler.h"
#include "core/service_availability_manager.h"
#include "core/tcp_probe.h"
#include <atomic>
#include <csignal>
#include <drogon/drogon.h>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

/**
 * @brief Admission server
 *
 * Serves the WebSocket entry point and the dependency health endpoint.
 * Dependency health is refreshed on a background thread; new WebSocket
 * connections are refused while critical dependencies are down.
 */

static std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
  if (signal != SIGINT && signal != SIGTERM) {
    return;
  }

  if (g_shutdown_requested.exchange(true)) {
    // Second signal: give up on graceful shutdown
    std::cerr << "[SHUTDOWN] Signal " << signal
              << " received again, forcing exit" << std::endl;
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    _exit(1);
  }

  std::cerr << "[SHUTDOWN] Received signal " << signal
            << ", shutting down gracefully..." << std::endl;
  drogon::app().quit();
}

static void printUsage(const char *program) {
  std::cout << "Usage: " << program << " [--config <path>]\n"
            << "\n"
            << "Environment:\n"
            << "  RESILIENCE_CONFIG          Config file (default "
               "config/resilience.json)\n"
            << "  ENVIRONMENT                development | staging | "
               "production\n"
            << "  SERVER_HOST, SERVER_PORT   Listen address\n"
            << "  HEALTH_CHECK_INTERVAL_MS   Health refresh interval\n"
            << "  HEALTH_PROBE_TIMEOUT_MS    Per-probe timeout\n"
            << "  LOG_DIR, LOG_LEVEL         Logging\n";
}

static void registerProbes(
    const ResilienceConfig &config, ServiceAvailabilityManager &manager,
    IScheduler &scheduler,
    std::vector<std::shared_ptr<CircuitBreaker>> &breakers) {
  // Retries must finish inside probe_timeout, otherwise the manager abandons
  // (and cancels) every failing check before the breaker records it. Keep a
  // tenth of the budget as headroom for thread start-up and scheduling.
  const auto probe_timeout = config.availability().probe_timeout;
  const CircuitBreakerConfig breaker_config =
      config.circuitBreaker().withinBudget(probe_timeout - probe_timeout / 10);
  const auto connect_timeout = breaker_config.timeout;
  PLOG_INFO << "[Main] Probe breakers: " << breaker_config.max_retry_attempts
            << " attempt(s) of " << connect_timeout.count() << "ms within "
            << probe_timeout.count() << "ms";

  for (const auto &probe : config.probes()) {
    const std::string name = serviceTypeToString(probe.service);
    auto breaker =
        std::make_shared<CircuitBreaker>(name, breaker_config, scheduler);
    breakers.push_back(breaker);

    manager.registerProbe(probe.service,
                          makeTcpProbe(probe.endpoint, connect_timeout,
                                       probe.slow_threshold, breaker));
    PLOG_INFO << "[Main] Probe registered: " << name << " -> "
              << probe.endpoint.toString();
  }
}

int main(int argc, char *argv[]) {
  std::string config_path =
      EnvConfig::getString("RESILIENCE_CONFIG", "config/resilience.json");
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    }
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      printUsage(argv[0]);
      return 1;
    }
  }

  try {
    Logger::init();

    PLOG_INFO << "========================================";
    PLOG_INFO << "Admission Guard Server";
    PLOG_INFO << "========================================";

    ResilienceConfig config;
    if (!config.loadFromFile(config_path)) {
      PLOG_FATAL << "Invalid configuration in " << config_path;
      return 1;
    }
    PLOG_INFO << "[Main] Environment: " << config.environment();

    // Declared first so it is destroyed last: its destructor waits for
    // abandoned probe workers that still call into the breakers below
    SystemScheduler scheduler;
    ServiceAvailabilityManager manager(scheduler, config.availability());

    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    registerProbes(config, manager, scheduler, breakers);
    if (config.probes().empty()) {
      PLOG_WARNING << "[Main] No probes configured, service health stays "
                      "unknown";
    }

    ServiceHealthHandler::setAvailabilityManager(&manager);
    AdmissionWebSocketController::setAvailabilityManager(&manager);

    HealthRefresher refresher(manager, scheduler,
                              config.availability().health_check_interval);
    refresher.start();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const auto &server = config.server();
    PLOG_INFO << "[Main] Listening on " << server.host << ":" << server.port
              << " (" << server.threads << " threads)";

    auto &app = drogon::app();
    app.setThreadNum(server.threads)
        .setLogLevel(trantor::Logger::kWarn)
        .addListener(server.host, server.port);
    app.run();

    PLOG_INFO << "[Server] Shutdown signal received, cleaning up...";
    refresher.stop();
    ServiceHealthHandler::setAvailabilityManager(nullptr);
    AdmissionWebSocketController::setAvailabilityManager(nullptr);

    PLOG_INFO << "Server stopped.";
    return 0;
  } catch (const std::exception &e) {
    PLOG_FATAL << "Fatal error: " << e.what();
    return 1;
  }
}
