#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace matchcore {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO handed between threads. Blocking pop() and
// non-blocking try_pop().
//
// Used at the two thread boundaries of the engine:
//   matching callers  -> notification EventLoopThread   (Event)
//   notification loop -> IpcServer worker               (Event)
// Producers never block on a consumer, which is what keeps a slow
// subscriber from stalling matching.
//
// Thread model: multiple producers and multiple consumers; all methods are
// thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable, non-movable: owns a mutex and a condition variable. Share
  // the queue by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one blocked pop(). T is taken by value so
  // callers can std::move into the queue.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on the mutex we still hold.
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(), blocking
  // -------------------------------------------------------------------------
  // Removes and returns the front item, waiting until one is available.
  // The predicate form of wait() handles spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(), non-blocking
  // -------------------------------------------------------------------------
  // Returns the front item, or std::nullopt immediately when empty.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may change it right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  // Snapshot only (used by STATUS reporting).
  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;           // Guards queue_
  std::condition_variable condition_;  // Signalled on push
  std::deque<T> queue_;
};

}  // namespace matchcore
