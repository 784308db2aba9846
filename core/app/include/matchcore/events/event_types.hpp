#pragma once

#include "matchcore/domain/order_book_snapshot.hpp"
#include "matchcore/domain/trade.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace matchcore {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time carried by every event for ordering and
// auditing. Produced from ITimeProvider::now_ms() via ms_to_timestamp().
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// TradeExecutedEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces one committed trade.
// Emitted by the MatchingEngine once per match step, after the trade has been
// persisted. Subscribers (IPC PUB socket, loggers) receive it on the
// notification loop thread, never on the matching thread.
// -----------------------------------------------------------------------------
struct TradeExecutedEvent {
  domain::Trade trade;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// OrderBookUpdatedEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries the freshly published snapshot of one symbol's book
// after a placement or cancellation changed it.
//
// The snapshot is shared, not copied: it is the same immutable object that
// getOrderBook() readers see, so fanning it out to many subscribers costs one
// reference count per copy of the event.
// -----------------------------------------------------------------------------
struct OrderBookUpdatedEvent {
  std::shared_ptr<const domain::OrderBookSnapshot> snapshot;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace matchcore
