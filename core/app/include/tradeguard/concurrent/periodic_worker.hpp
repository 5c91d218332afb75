#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tradeguard {

// -----------------------------------------------------------------------------
// PeriodicWorker
// -----------------------------------------------------------------------------
//
// @brief  Runs a task on its own thread every `period` until stopped.
//
// @details
// Drives the connection-health tick: the kill switch has to be evaluated
// even when no decision is pending, so the tick cannot piggyback on
// execute().
//
// The first run happens one period after start(). Between runs the thread
// waits on a condition variable, so stop() returns within one task
// execution rather than one period.
//
// A task that throws std::exception is logged and the schedule continues.
//
// Thread model: start()/stop() from the owning thread. The task runs on the
// worker thread only.
// -----------------------------------------------------------------------------
class PeriodicWorker {
 public:
  using Task = std::function<void()>;

  PeriodicWorker(std::string name, std::chrono::milliseconds period, Task task);
  ~PeriodicWorker();

  PeriodicWorker(const PeriodicWorker&) = delete;
  PeriodicWorker& operator=(const PeriodicWorker&) = delete;
  PeriodicWorker(PeriodicWorker&&) = delete;
  PeriodicWorker& operator=(PeriodicWorker&&) = delete;

  void start();
  void stop();

  bool isRunning() const { return running_.load(); }

 private:
  void run();

  std::string name_;
  std::chrono::milliseconds period_;
  Task task_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace tradeguard
