#include "matchcore/concurrent/event_loop_thread.hpp"
#include <chrono>

namespace matchcore {

namespace {

// How long the idle worker waits before re-checking running_. stop() also
// notifies, so this only bounds the latency of a missed notification.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

// -----------------------------------------------------------------------------
// Destructor
// -----------------------------------------------------------------------------
EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  // Set before spawning so the worker's first check sees true.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  stop_cv_.notify_all();

  // No lock held across join(); the worker never needs one we own here.
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(), worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }

  // Final drain: deliver what was pushed before stop().
  while (auto event = queue_.try_pop()) {
    bus_.publish(*event);
  }
}

}  // namespace matchcore
