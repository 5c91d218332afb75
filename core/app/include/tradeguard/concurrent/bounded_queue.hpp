#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace tradeguard {

// -----------------------------------------------------------------------------
// BoundedQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A fixed-capacity FIFO channel between threads. Producers
// block in push() while the queue is full; consumers block in pop() while
// it is empty. try_push()/try_pop() never block.
//
// Why bounded: the venue adapter pushes stream events (fills, acks,
// connection state) into the core. If the core stalls, an unbounded queue
// would hide the stall behind growing memory; a bounded one pushes back on
// the adapter, whose transport then buffers or drops at its own layer.
//
// Thread model: Multiple producers, multiple consumers. All methods are
// thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
 public:
  // capacity must be at least 1.
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedQueue capacity must be > 0");
    }
  }

  // Non-copyable, non-movable: owns a mutex and two condition variables.
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value): blocking
  // -------------------------------------------------------------------------
  // Appends one item, waiting for free space if the queue is full. Wakes one
  // consumer blocked in pop().
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock, [this] { return queue_.size() < capacity_; });
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
  }

  // -------------------------------------------------------------------------
  // try_push(value): non-blocking
  // -------------------------------------------------------------------------
  // Returns false (and leaves value untouched in the caller's frame) when
  // the queue is full.
  // -------------------------------------------------------------------------
  bool try_push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  T pop() {
    T value = [this] {
      std::unique_lock lock(mutex_);
      not_empty_.wait(lock, [this] { return !queue_.empty(); });
      T front = std::move(queue_.front());
      queue_.pop_front();
      return front;
    }();
    not_full_.notify_one();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout): blocking with a deadline
  // -------------------------------------------------------------------------
  // Waits up to timeout for an item. Returns std::nullopt on timeout.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::optional<T> value;
    {
      std::unique_lock lock(mutex_);
      if (!not_empty_.wait_for(lock, timeout,
                               [this] { return !queue_.empty(); })) {
        return std::nullopt;
      }
      value.emplace(std::move(queue_.front()));
      queue_.pop_front();
    }
    not_full_.notify_one();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  // Returns std::nullopt immediately if the queue is empty.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::optional<T> value;
    {
      std::lock_guard lock(mutex_);
      if (queue_.empty()) {
        return std::nullopt;
      }
      value.emplace(std::move(queue_.front()));
      queue_.pop_front();
    }
    not_full_.notify_one();
    return value;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;  // Signalled after push
  std::condition_variable not_full_;   // Signalled after pop
  std::deque<T> queue_;
};

}  // namespace tradeguard
