#pragma once

#include "matchcore/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace matchcore {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// The clock and the domain types speak epoch milliseconds; event structs
// carry a Timestamp (system_clock::time_point). These two inline helpers
// bridge the representations. Stateless.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace matchcore
