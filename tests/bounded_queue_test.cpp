// =============================================================================
// bounded_queue_test.cpp
// =============================================================================
// Unit tests for tradeguard::BoundedQueue<T>.
//
// Validates:
//   - FIFO order
//   - Capacity: try_push() refuses when full, push() blocks until space
//   - try_pop() on empty and non-empty queues
//   - Blocking pop() wakes on push, pop_for() gives up at its deadline
//   - No lost or duplicated items under multi-producer / multi-consumer load
//
// Threading model:
//   Threads spawned by a test are joined before its assertions.
// =============================================================================

#include "tradeguard/concurrent/bounded_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

class BoundedQueueTest : public ::testing::Test {
 protected:
  tradeguard::BoundedQueue<int> queue{4};
};

// -----------------------------------------------------------------------------
// 1. Zero capacity is a construction error.
// -----------------------------------------------------------------------------
TEST(BoundedQueueConstruction, ZeroCapacityThrows) {
  EXPECT_THROW(tradeguard::BoundedQueue<int>(0), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. Items come back in the order they went in.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, FifoOrder) {
  for (int i = 0; i < 4; ++i) {
    queue.push(i);
  }
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(queue.pop(), i);
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_push() fails once capacity is reached and succeeds again after a
//    pop. The telemetry path depends on this never blocking.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, TryPushRefusesWhenFull) {
  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(queue.try_push(i));
  }
  EXPECT_FALSE(queue.try_push(99));
  EXPECT_EQ(queue.size(), 4u);

  EXPECT_EQ(queue.pop(), 0);
  EXPECT_TRUE(queue.try_push(4));
  EXPECT_EQ(queue.size(), 4u);
}

// -----------------------------------------------------------------------------
// 4. try_pop() returns nullopt on empty, the front item otherwise.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(7);
  auto item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 7);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 5. push() on a full queue blocks until a consumer makes room.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, PushBlocksWhileFull) {
  for (int i = 0; i < 4; ++i) {
    queue.push(i);
  }

  std::atomic<bool> pushed{false};
  std::thread producer([this, &pushed] {
    queue.push(4);
    pushed.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(pushed.load());

  EXPECT_EQ(queue.pop(), 0);
  producer.join();

  EXPECT_TRUE(pushed.load());
  EXPECT_EQ(queue.size(), 4u);
}

// -----------------------------------------------------------------------------
// 6. pop() on an empty queue blocks until a producer pushes.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, PopBlocksWhileEmpty) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();
  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 7. Four producers, four consumers, a queue much smaller than the load:
//    every item is delivered exactly once.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kItemsPerProducer = 500;
  constexpr int kTotal = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = p * kItemsPerProducer; i < (p + 1) * kItemsPerProducer;
           ++i) {
        queue.push(i);
      }
    });
  }

  std::vector<std::vector<int>> received(kProducers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kProducers; ++c) {
    consumers.emplace_back([this, c, &received] {
      for (int i = 0; i < kItemsPerProducer; ++i) {
        received[c].push_back(queue.pop());
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : received) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());
  ASSERT_EQ(static_cast<int>(all.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    EXPECT_EQ(all[i], i);
  }
}

// -----------------------------------------------------------------------------
// 8. pop_for() returns nullopt after its deadline on an empty queue and the
//    item when one is pushed before the deadline.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, PopForTimesOutThenReceives) {
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(15)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - t0,
            std::chrono::milliseconds(15));

  std::thread producer([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    queue.push(5);
  });
  auto item = queue.pop_for(std::chrono::seconds(2));
  producer.join();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 5);
}
