#include "tradeguard/concurrent/periodic_worker.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace tradeguard {

PeriodicWorker::PeriodicWorker(std::string name,
                               std::chrono::milliseconds period, Task task)
    : name_(std::move(name)), period_(period), task_(std::move(task)) {}

PeriodicWorker::~PeriodicWorker() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PeriodicWorker::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PeriodicWorker::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    // Store under the mutex so the worker cannot miss the notify between
    // its predicate check and the wait.
    std::lock_guard lock(stop_mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): wait one period, run the task, repeat
// -----------------------------------------------------------------------------
void PeriodicWorker::run() {
  while (true) {
    {
      std::unique_lock lock(stop_mutex_);
      if (stop_cv_.wait_for(lock, period_,
                            [this] { return !running_.load(); })) {
        return;
      }
    }

    try {
      task_();
    } catch (const std::exception& e) {
      std::cerr << "[PeriodicWorker:" << name_
                << "] WARNING: task threw: " << e.what() << "\n";
    }
  }
}

}  // namespace tradeguard
