#pragma once

#include "tradeguard/concurrent/bounded_queue.hpp"
#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <thread>

namespace tradeguard {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a BoundedQueue<Event>
// and publishes each event on its EventBus. This is the core's single-writer
// path: every venue event is applied to OrderTracker from this thread, in
// the order it was pushed.
//
// Thread model: push() may be called from any thread (the venue adapter's
// callback thread in practice). Subscribers run on the loop thread only.
// start()/stop() may be called from any thread but not concurrently with
// each other.
//
// Failure policy: a subscriber that throws does not kill the thread. The
// loop logs the exception and forwards it to the error handler (if set),
// then continues with the next event.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  using ErrorHandler = std::function<void(const Event&, const std::exception&)>;

  explicit EventLoopThread(std::size_t queue_capacity = 4096,
                           std::string name = "core_loop");

  // Stops and joins the worker; remaining queued events are drained first.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Spawns the worker. No-op if already running.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Signals the worker, waits for it to publish whatever is still queued,
  // and joins. Idempotent. start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // push(event)
  // -------------------------------------------------------------------------
  // Enqueues one event. Blocks while the queue is full.
  // -------------------------------------------------------------------------
  void push(Event event) { queue_.push(std::move(event)); }

  // Non-blocking variant. Returns false when the queue is full.
  bool tryPush(Event event) { return queue_.try_push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  // Must be set before start().
  void setErrorHandler(ErrorHandler handler) {
    error_handler_ = std::move(handler);
  }

  bool isRunning() const { return running_.load(); }

  std::size_t pending() const { return queue_.size(); }

  // Events whose dispatch raised, since construction.
  std::size_t failedDispatches() const { return failed_.load(); }

 private:
  // Worker entry point: pop_for with a short deadline so a cleared
  // running_ flag is noticed, then drain what is left.
  void run();

  // Publishes one event, routing subscriber exceptions to error_handler_.
  void dispatch(const Event& event);

  std::string name_;
  BoundedQueue<Event> queue_;
  EventBus bus_;
  ErrorHandler error_handler_;

  std::atomic<bool> running_{false};
  std::atomic<std::size_t> failed_{0};
  std::thread thread_;
};

}  // namespace tradeguard
