#pragma once

#include "event_types.hpp"
#include "order_update_event.hpp"
#include <variant>

namespace matchcore {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for everything the engine announces.
// One EventBus carries every kind; subscribers pick theirs with the typed
// subscribe<T>() or with std::get_if/std::visit.
//
// Adding a kind means adding it here and to every visit site (the JSON codec
// and the IPC formatter); std::visit makes the compiler enforce that.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TradeExecutedEvent,
    OrderBookUpdatedEvent,
    OrderUpdateEvent>;

}  // namespace matchcore
