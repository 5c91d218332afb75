#include "tradeguard/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace tradeguard {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kPopDeadline = std::chrono::milliseconds(5);

}  // namespace

EventLoopThread::EventLoopThread(std::size_t queue_capacity, std::string name)
    : name_(std::move(name)), queue_(queue_capacity) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[EventLoopThread:" << name_ << "] started. capacity="
            << queue_.capacity() << "\n";
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
  std::cout << "[EventLoopThread:" << name_ << "] stopped. failed="
            << failed_.load() << "\n";
}

// -----------------------------------------------------------------------------
// run(): one consumer, events published in push order
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (auto event = queue_.pop_for(kPopDeadline)) {
      dispatch(*event);
    }
  }

  // Fills queued before shutdown still reach the tracker.
  std::size_t drained = 0;
  while (auto event = queue_.try_pop()) {
    dispatch(*event);
    ++drained;
  }
  if (drained > 0) {
    std::cout << "[EventLoopThread:" << name_ << "] drained " << drained
              << " queued event(s) on stop.\n";
  }
}

void EventLoopThread::dispatch(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    ++failed_;
    std::cerr << "[EventLoopThread:" << name_
              << "] CRITICAL: dispatch failed: " << e.what() << "\n";
    if (error_handler_) {
      error_handler_(event, e);
    }
  }
}

}  // namespace tradeguard
