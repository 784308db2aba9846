// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for matchcore::ThreadSafeQueue<T>, the hand-off between the
// matching callers, the notification loop and the IPC worker.
//
// Validates:
//   - FIFO order (events must reach subscribers in emission order)
//   - try_pop on empty and non-empty queues, size()
//   - Move-only payloads
//   - Blocking pop wakes on push
//   - No loss or duplication under many producers and consumers
// =============================================================================

#include "matchcore/concurrent/thread_safe_queue.hpp"
#include "matchcore/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  matchcore::ThreadSafeQueue<std::uint64_t> queue;
};

// -----------------------------------------------------------------------------
// 1. Sequence numbers come out in the order they went in.
// Why: Subscribers rely on sequence_id increasing along the stream.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PreservesFifoOrder) {
  EXPECT_TRUE(queue.empty());

  for (std::uint64_t seq = 1; seq <= 50; ++seq) {
    queue.push(seq);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (std::uint64_t seq = 1; seq <= 50; ++seq) {
    EXPECT_EQ(queue.pop(), seq);
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop returns nullopt on empty, the front item otherwise.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(11);
  queue.push(12);
  auto first = queue.try_pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 11u);
  EXPECT_EQ(queue.size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Engine events, including ones holding a shared snapshot, pass through
//    without copying the snapshot; move-only payloads work too.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueEventTest, CarriesEventsAndMoveOnlyValues) {
  matchcore::ThreadSafeQueue<matchcore::Event> events;
  auto snapshot = std::make_shared<const matchcore::domain::OrderBookSnapshot>();
  events.push(matchcore::OrderBookUpdatedEvent{snapshot, {}, 3});

  auto event = events.try_pop();
  ASSERT_TRUE(event.has_value());
  const auto* update = std::get_if<matchcore::OrderBookUpdatedEvent>(&*event);
  ASSERT_NE(update, nullptr);
  EXPECT_EQ(update->snapshot.get(), snapshot.get());
  EXPECT_EQ(update->sequence_id, 3u);

  matchcore::ThreadSafeQueue<std::unique_ptr<int>> owned;
  owned.push(std::make_unique<int>(5));
  auto value = owned.pop();
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(*value, 5);
}

// -----------------------------------------------------------------------------
// 4. A consumer blocked in pop() wakes when a producer pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<std::uint64_t> received{0};

  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), 0u);

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77u);
}

// -----------------------------------------------------------------------------
// 5. Many producers, many consumers: every item popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 3;
  constexpr int kPerProducer = 2000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const std::uint64_t base = static_cast<std::uint64_t>(p) * kPerProducer;
      for (std::uint64_t i = 0; i < kPerProducer; ++i) {
        queue.push(base + i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<std::uint64_t>> seen(kConsumers);
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

  std::vector<std::uint64_t> all;
  for (const auto& part : seen) {
    all.insert(all.end(), part.begin(), part.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(all.size(), static_cast<std::size_t>(kTotal));
  for (std::size_t i = 0; i < all.size(); ++i) {
    EXPECT_EQ(all[i], i) << "missing or duplicate item at " << i;
  }
}
