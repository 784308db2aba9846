#pragma once

#include "matchcore/concurrent/thread_safe_queue.hpp"
#include "matchcore/eventbus/event_bus.hpp"
#include "matchcore/events/event.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace matchcore {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its EventBus. Any thread may push(); every
// subscriber callback runs on the worker thread, one event at a time.
//
// In the engine this is the notification fan-out: the MatchingEngine's event
// sink pushes here while holding a symbol lock, and the push is a short
// queue append. Subscribers (IPC bridge, loggers, tests) run later on the
// worker, so a slow or re-entrant subscriber can never stall a match or
// re-enter the engine under a lock held by the same call stack.
//
// Ordering: events are published in push order. Events pushed from one
// matching call therefore reach subscribers in the order they were emitted.
//
// Shutdown: stop() publishes whatever is still queued before joining, so
// events emitted before stop() are not dropped.
//
// Thread model: start(), stop() and push() are safe from any thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Stops and joins the worker if it is still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Spawns the worker. Idempotent: a second call is a no-op.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Signals the worker, which drains the queue and exits; then joins.
  // After stop(), start() may be called again. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues one event for publication on the worker thread.
  void push(Event event) { queue_.push(std::move(event)); }

  // Bus the worker publishes to. Subscribe here.
  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool isRunning() const { return running_.load(); }

  // Events queued but not yet published (snapshot).
  std::size_t backlog() const { return queue_.size(); }

 private:
  // Worker loop: try_pop and publish; when idle, wait on stop_cv_ with a
  // short timeout so stop() is noticed promptly.
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace matchcore
