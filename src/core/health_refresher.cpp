#include "core/health_refresher.h"
#include "core/resilience_errors.h"
#include "core/service_availability_manager.h"
#include <plog/Log.h>

HealthRefresher::HealthRefresher(ServiceAvailabilityManager &manager,
                                 IScheduler &scheduler,
                                 std::chrono::milliseconds interval)
    : manager_(manager), scheduler_(scheduler), interval_(interval) {}

HealthRefresher::~HealthRefresher() { stop(); }

void HealthRefresher::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    PLOG_WARNING << "[HealthRefresher] Already running";
    return;
  }

  stop_token_ = std::make_shared<CancellationToken>();
  running_.store(true);
  refresh_thread_ =
      std::make_unique<std::thread>(&HealthRefresher::refreshLoop, this);

  PLOG_INFO << "[HealthRefresher] Started (interval=" << interval_.count()
            << "ms)";
}

void HealthRefresher::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.load()) {
    return;
  }

  running_.store(false);
  stop_token_->cancel();

  // Every wait in the loop observes stop_token_, so the join is bounded
  if (refresh_thread_ && refresh_thread_->joinable()) {
    refresh_thread_->join();
  }
  refresh_thread_.reset();

  PLOG_INFO << "[HealthRefresher] Stopped";
}

HealthRefresher::Stats HealthRefresher::getStats() const {
  return {completed_rounds_.load(), failed_rounds_.load()};
}

void HealthRefresher::refreshLoop() {
  const CancellationTokenPtr token = stop_token_;

  while (running_.load()) {
    try {
      manager_.checkAllServices(token);
      completed_rounds_++;
    } catch (const OperationCancelled &) {
      break;
    } catch (const std::exception &e) {
      failed_rounds_++;
      PLOG_ERROR << "[HealthRefresher] Health check round failed: "
                 << e.what();
    }

    if (!scheduler_.sleepFor(interval_, token)) {
      break;
    }
  }

  PLOG_DEBUG << "[HealthRefresher] Refresh thread exiting";
}
