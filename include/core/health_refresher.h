#pragma once

#include "core/cancellation_token.h"
#include "core/scheduler.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

class ServiceAvailabilityManager;

/**
 * @brief Keeps the availability manager's cached health fresh
 *
 * Runs checkAllServices() on its own thread every interval so admission
 * checks rarely pay for a probe round. stop() cancels an in-flight check.
 */
class HealthRefresher {
public:
  /**
   * @param manager Manager to refresh; must outlive the refresher
   * @param scheduler Used for the sleeps between rounds
   * @param interval Time between rounds
   */
  HealthRefresher(ServiceAvailabilityManager &manager, IScheduler &scheduler,
                  std::chrono::milliseconds interval);

  ~HealthRefresher();

  HealthRefresher(const HealthRefresher &) = delete;
  HealthRefresher &operator=(const HealthRefresher &) = delete;

  void start();
  void stop();

  bool isRunning() const { return running_.load(); }

  struct Stats {
    uint64_t completed_rounds;
    uint64_t failed_rounds;
  };

  Stats getStats() const;

private:
  void refreshLoop();

  ServiceAvailabilityManager &manager_;
  IScheduler &scheduler_;
  std::chrono::milliseconds interval_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  CancellationTokenPtr stop_token_;
  std::unique_ptr<std::thread> refresh_thread_;

  std::atomic<uint64_t> completed_rounds_{0};
  std::atomic<uint64_t> failed_rounds_{0};
};
