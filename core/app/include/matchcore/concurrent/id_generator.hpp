#pragma once

#include <atomic>
#include <cstdint>

namespace matchcore {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids from an atomic counter. Each order store owns
//         one for orders and one for trades; the MatchingEngine owns one for
//         event sequence numbers.
//
// @details
// The counter starts at 1; id 0 is reserved as the "unset" sentinel that
// validation rejects. next_id() is a relaxed fetch_add: the only requirement
// is uniqueness, there is no ordering relation with other memory.
//
// advancePast(id) is used after a journal replay so that freshly assigned
// ids continue after the largest id already persisted. It only ever moves
// the counter forward (compare-exchange loop), so calling it with a stale
// value is harmless.
//
// Thread model:
//   Both methods are safe to call concurrently from any thread.
//
// Ownership:
//   Value member of its owner. Non-copyable: two copies would hand out the
//   same ids.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  // Returns the next unique id (1, 2, 3, ...).
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // advancePast(id)
  // -------------------------------------------------------------------------
  // @brief  Guarantees that every later next_id() returns a value > id.
  // -------------------------------------------------------------------------
  void advancePast(std::uint64_t id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

  // The id the next call to next_id() would return (diagnostics only).
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace matchcore
