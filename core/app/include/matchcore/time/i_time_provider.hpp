#pragma once

#include <cstdint>

namespace matchcore {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  The engine's only notion of "now".
//
// @details
// Order creation times drive time priority, trade timestamps go to the
// store, and the snapshot cache expires entries by age. All of them read
// the clock through this interface so that tests can pin time:
//
//   LiveTimeProvider        -> std::chrono::system_clock
//   SimulationTimeProvider  -> value set explicitly by the test/harness
//
// Time is int64 milliseconds since the Unix epoch, the same unit the JSON
// codec and the journal store, so no conversion happens at the edges.
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently. Writers (advance_time) must
//   synchronize internally.
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Current epoch time in milliseconds.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace matchcore
