#pragma once

#include "matchcore/domain/decimal.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace matchcore {
namespace domain {

// -----------------------------------------------------------------------------
// BookStats: trade-derived aggregates of one symbol
// -----------------------------------------------------------------------------
//
// @brief  Last price and rolling 24h volume/high/low.
//
// @details
// Updated incrementally by OrderBook::updateOnTrade(), never recomputed from
// trade history. last_price/high_24h/low_24h stay empty until the first
// trade. After any trade at price p:
//
//   high_24h >= last_price == p >= low_24h
//
// The 24h window is maintained outside the engine: a scheduled job calls
// resetRollingStats(), which clears volume/high/low but keeps last_price.
// -----------------------------------------------------------------------------
struct BookStats {
  std::string symbol;
  std::optional<Decimal> last_price;
  Decimal volume_24h;
  std::optional<Decimal> high_24h;
  std::optional<Decimal> low_24h;
  std::int64_t updated_at_ms{0};
};

}  // namespace domain
}  // namespace matchcore
