#pragma once

#include "matchcore/time/i_time_provider.hpp"

namespace matchcore {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Used by the matchcore executable. Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace matchcore
