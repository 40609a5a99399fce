#include "core/scheduler.h"
#include "core/resilience_errors.h"
#include <algorithm>
#include <exception>
#include <future>
#include <plog/Log.h>
#include <string>
#include <system_error>
#include <thread>

SystemScheduler::~SystemScheduler() {
  std::unique_lock<std::mutex> lock(workers_->mutex);
  if (!workers_->idle.wait_for(lock, DRAIN_TIMEOUT,
                               [this] { return workers_->running == 0; })) {
    PLOG_WARNING << "[Scheduler] " << workers_->running
                 << " abandoned task(s) still running at shutdown";
  }
}

size_t SystemScheduler::runningTasks() const {
  std::lock_guard<std::mutex> lock(workers_->mutex);
  return workers_->running;
}

IScheduler::TimePoint SystemScheduler::now() const {
  return std::chrono::steady_clock::now();
}

IScheduler::WallTimePoint SystemScheduler::wallNow() const {
  return std::chrono::system_clock::now();
}

bool SystemScheduler::sleepFor(std::chrono::milliseconds duration,
                               const CancellationTokenPtr &cancel) {
  if (duration.count() <= 0) {
    return !(cancel && cancel->isCancelled());
  }
  if (!cancel) {
    std::this_thread::sleep_for(duration);
    return true;
  }
  return !cancel->waitFor(duration);
}

void SystemScheduler::runWithTimeout(Task task,
                                     std::chrono::milliseconds timeout,
                                     const CancellationTokenPtr &cancel) {
  if (cancel && cancel->isCancelled()) {
    throw OperationCancelled("Operation cancelled before start");
  }

  // Shared with the worker so an abandoned task never touches freed state
  auto token = std::make_shared<CancellationToken>();
  auto promise = std::make_shared<std::promise<void>>();
  std::future<void> future = promise->get_future();

  {
    std::lock_guard<std::mutex> lock(workers_->mutex);
    workers_->running++;
  }
  try {
    std::thread worker(
        [task = std::move(task), token, promise, workers = workers_]() {
          try {
            task(token);
            promise->set_value();
          } catch (...) {
            promise->set_exception(std::current_exception());
          }
          std::lock_guard<std::mutex> lock(workers->mutex);
          workers->running--;
          workers->idle.notify_all();
        });
    worker.detach();
  } catch (const std::system_error &) {
    std::lock_guard<std::mutex> lock(workers_->mutex);
    workers_->running--;
    throw;
  }

  const auto deadline = now() + timeout;
  while (true) {
    if (cancel && cancel->isCancelled()) {
      token->cancel();
      throw OperationCancelled("Operation cancelled by caller");
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                              now());
    if (remaining.count() <= 0) {
      token->cancel();
      throw OperationTimeout("Operation timed out after " +
                             std::to_string(timeout.count()) + "ms");
    }

    if (future.wait_for(std::min(remaining, POLL_SLICE)) ==
        std::future_status::ready) {
      future.get();
      return;
    }
  }
}
