#pragma once

#include "matchcore/domain/order.hpp"
#include "matchcore/domain/order_status.hpp"
#include "matchcore/events/event_types.hpp"

namespace matchcore {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by the MatchingEngine whenever an order's status changes.
//         Carries a snapshot of the order and the status it left.
//
// @details
// Emitted for every maker touched by a match step, once for the taker at the
// end of placeOrder() (only if its status moved off Pending), and once for a
// successful cancel. Lets subscribers follow the full lifecycle of every
// order without reading engine state.
//
// Thread model:
//   Built on the matching thread, pushed to the notification loop and
//   delivered there. Plain data; safe to copy across threads.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;                                                // After
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};  // Before
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace matchcore
