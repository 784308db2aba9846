#pragma once

#include "matchcore/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace matchcore {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly.
//
// @details
// Tests use it to make time priority and cache expiry deterministic: two
// orders placed at the same simulated millisecond fall back to id order,
// advancing past the cache TTL forces a recompute, and so on.
//
// Storage is a std::atomic<int64_t>, so readers on matching threads and a
// writer on the test thread need no further synchronization.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute time.
  //
  // @details
  // Monotonicity is the caller's responsibility; tests sometimes need to set
  // arbitrary times.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace matchcore
