#pragma once

#include "matchcore/domain/decimal.hpp"

#include <optional>
#include <string_view>

namespace matchcore {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a limit order can occupy.
//
// @details
// The lifecycle is small and strictly forward-moving:
//
//   Pending ───> PartiallyFilled ───> Filled
//      │  │              │   ▲
//      │  └──────────────┼───┘ (a single fill may complete the order)
//      ▼                 ▼
//   Cancelled        Cancelled
//
// Terminal states: Filled, Cancelled. No transition leaves a terminal state.
//
// Apart from cancellation, the status is a pure function of the fill:
//   filled == 0            -> Pending
//   0 < filled < amount    -> PartiallyFilled
//   filled == amount       -> Filled
// statusForFill() is the single place that computes it, so the matching
// loop never assigns a fill status by hand.
//
// The text form ("pending", "partially_filled", "filled", "cancelled") is
// what the JSON codec, the journal and the IPC telemetry carry.
//
// Thread model:
//   Plain enum and free functions. Safe to use from any thread.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,          // Resting or just submitted, nothing filled yet
  PartiallyFilled,  // Some amount filled, remainder still open
  Filled,           // Fully filled, terminal
  Cancelled,        // Cancelled by its owner, terminal
};

// True for Filled and Cancelled.
bool isTerminal(OrderStatus status);

// True for Pending and PartiallyFilled (eligible to rest and match).
bool isOpen(OrderStatus status);

// -----------------------------------------------------------------------------
// statusForFill(filled, amount)
// -----------------------------------------------------------------------------
// @brief  Derives the fill status from the cumulative fill.
//
// @pre    0 <= filled <= amount, amount > 0.
// -----------------------------------------------------------------------------
OrderStatus statusForFill(const Decimal& filled, const Decimal& amount);

// -----------------------------------------------------------------------------
// isLegalTransition(current, next)
// -----------------------------------------------------------------------------
// @brief  Validates a status change against the graph above.
//
// @details
// PartiallyFilled -> PartiallyFilled is legal (another partial fill).
// Pending -> Pending is not: it would mean an update without a change.
// -----------------------------------------------------------------------------
bool isLegalTransition(OrderStatus current, OrderStatus next);

const char* toString(OrderStatus status);

// Inverse of toString(). std::nullopt for unknown text.
std::optional<OrderStatus> parseOrderStatus(std::string_view text);

}  // namespace domain
}  // namespace matchcore
