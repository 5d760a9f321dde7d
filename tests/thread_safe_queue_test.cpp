// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for cppi::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO delivery, which is what keeps a position's ticks in order
//   - try_pop() on empty and non-empty queues
//   - pop() blocks until a producer pushes
//   - size() bookkeeping
//   - Move-only payloads and Event variants pass through intact
//   - No lost or duplicated items under multi-producer / multi-consumer load
// =============================================================================

#include "cppi/concurrent/thread_safe_queue.hpp"
#include "cppi/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  cppi::ThreadSafeQueue<int> queue;
};

TEST_F(ThreadSafeQueueTest, StartsEmpty) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// Ticks for one position must come out in the order the feed produced them.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PreservesFifoOrder) {
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(queue.pop(), i) << "order broken at " << i;
  }
  EXPECT_TRUE(queue.empty());
}

TEST_F(ThreadSafeQueueTest, TryPopOnEmptyQueueReturnsNullopt) {
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST_F(ThreadSafeQueueTest, TryPopReturnsFrontItem) {
  queue.push(7);
  queue.push(8);

  auto first = queue.try_pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 7);
  EXPECT_EQ(queue.size(), 1u);
}

// -----------------------------------------------------------------------------
// pop() must park the consumer until something arrives.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopBlocksUntilPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(123);
  consumer.join();

  EXPECT_EQ(received.load(), 123);
}

TEST(ThreadSafeQueueMoveOnly, AcceptsMoveOnlyPayloads) {
  cppi::ThreadSafeQueue<std::unique_ptr<int>> q;
  q.push(std::make_unique<int>(5));

  auto item = q.try_pop();
  ASSERT_TRUE(item.has_value());
  ASSERT_NE(*item, nullptr);
  EXPECT_EQ(**item, 5);
}

TEST(ThreadSafeQueueEvents, CarriesEventVariantsIntact) {
  cppi::ThreadSafeQueue<cppi::Event> q;

  cppi::ValuationTickEvent tick;
  tick.position_id = 9;
  tick.value = 10'250.0;
  tick.timestamp_ms = 1'000;
  q.push(tick);

  cppi::Event out = q.pop();
  const auto* decoded = std::get_if<cppi::ValuationTickEvent>(&out);
  ASSERT_NE(decoded, nullptr);
  EXPECT_EQ(decoded->position_id, 9u);
  EXPECT_DOUBLE_EQ(decoded->value, 10'250.0);
  EXPECT_FALSE(decoded->volatility.has_value());
}

// -----------------------------------------------------------------------------
// Several producers and consumers: every item is delivered exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 3;
  constexpr int kPerProducer = 500;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = p * kPerProducer; i < (p + 1) * kPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> seen(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &seen] {
      while (consumed.load() < kTotal) {
        if (auto item = queue.try_pop()) {
          seen[c].push_back(*item);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : seen) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    ASSERT_EQ(all[i], i) << "missing or duplicate item " << i;
  }
}
