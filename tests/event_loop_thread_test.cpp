// =============================================================================
// event_loop_thread_test.cpp
// =============================================================================
// Tests for matchcore::EventLoopThread, the asynchronous notification
// channel: events pushed from any thread are published on the worker, in
// push order, and stop() delivers what is still queued.
// =============================================================================

#include "matchcore/concurrent/event_loop_thread.hpp"
#include "matchcore/events/event.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace {

matchcore::OrderUpdateEvent makeUpdate(std::uint64_t seq) {
  matchcore::OrderUpdateEvent e;
  e.order.id = seq;
  e.sequence_id = seq;
  return e;
}

// Polls until pred() or the deadline.
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Subscribers run on the worker thread, not the pushing thread.
// Why: Matching pushes while holding a symbol lock; a subscriber running
//      inline would extend that lock.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DeliversOnWorkerThread) {
  matchcore::EventLoopThread loop;
  std::atomic<bool> delivered{false};
  std::thread::id delivery_thread;

  loop.eventBus().subscribe([&](const matchcore::Event&) {
    delivery_thread = std::this_thread::get_id();
    delivered.store(true);
  });

  loop.start();
  EXPECT_TRUE(loop.isRunning());
  loop.push(makeUpdate(1));

  ASSERT_TRUE(waitFor([&] { return delivered.load(); },
                      std::chrono::milliseconds(2000)));
  loop.stop();

  EXPECT_NE(delivery_thread, std::this_thread::get_id());
  EXPECT_FALSE(loop.isRunning());
}

// -----------------------------------------------------------------------------
// 2. Order is preserved, and events queued before start() or right before
//    stop() are still delivered.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, PreservesOrderAndDrainsOnStop) {
  matchcore::EventLoopThread loop;
  std::mutex mutex;
  std::vector<std::uint64_t> seen;

  loop.eventBus().subscribe<matchcore::OrderUpdateEvent>(
      [&](const matchcore::OrderUpdateEvent& e) {
        std::lock_guard lock(mutex);
        seen.push_back(e.sequence_id);
      });

  loop.push(makeUpdate(1));
  loop.push(makeUpdate(2));
  EXPECT_EQ(loop.backlog(), 2u);

  loop.start();
  for (std::uint64_t seq = 3; seq <= 500; ++seq) {
    loop.push(makeUpdate(seq));
  }
  loop.stop();

  EXPECT_EQ(loop.backlog(), 0u);
  ASSERT_EQ(seen.size(), 500u);
  for (std::size_t i = 0; i < seen.size(); ++i) {
    EXPECT_EQ(seen[i], i + 1);
  }
}

// -----------------------------------------------------------------------------
// 3. start() and stop() are idempotent, and the loop can be restarted.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, StartStopIdempotent) {
  matchcore::EventLoopThread loop;
  std::atomic<int> calls{0};
  loop.eventBus().subscribe([&](const matchcore::Event&) { ++calls; });

  loop.stop();
  loop.start();
  loop.start();
  loop.push(makeUpdate(1));
  loop.stop();
  loop.stop();

  loop.start();
  loop.push(makeUpdate(2));
  loop.stop();

  EXPECT_EQ(calls.load(), 2);
}
