#pragma once

#include "matchcore/domain/book_stats.hpp"
#include "matchcore/domain/decimal.hpp"
#include "matchcore/domain/order.hpp"
#include "matchcore/domain/order_book_snapshot.hpp"
#include "matchcore/domain/trade.hpp"
#include "matchcore/events/event.hpp"

#include <nlohmann/json.hpp>

namespace matchcore {
namespace domain {

// -----------------------------------------------------------------------------
// JSON codec for the domain types
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json to_json/from_json overloads, found by ADL, so any
//         domain value converts with nlohmann::json(x) and j.get<T>().
//
// @details
// One encoding is shared by every collaborator: the order journal, the
// snapshot cache, IPC telemetry and the STATUS/BOOK command replies.
//
//   Decimal      -> JSON string in canonical form ("100", "0.5"). Never a
//                   JSON number, so no value ever passes through a double.
//   Side/Status  -> lowercase text ("buy", "partially_filled").
//   optional<T>  -> value or null.
//   Trade        -> carries buy_order_id and sell_order_id, so the link from
//                   a trade to both of its orders survives serialization.
//
// Decoding errors:
//   Missing keys and wrong JSON types throw nlohmann::json::exception.
//   Well-typed but invalid text (a malformed decimal, an unknown side or
//   status) throws std::invalid_argument. Callers that read untrusted input
//   catch both.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Decimal& value);
void from_json(const nlohmann::json& j, Decimal& value);

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);

void to_json(nlohmann::json& j, const BookStats& stats);
void from_json(const nlohmann::json& j, BookStats& stats);

void to_json(nlohmann::json& j, const BookEntry& entry);
void from_json(const nlohmann::json& j, BookEntry& entry);

// Flattened: the stats fields sit beside "bids" and "asks".
void to_json(nlohmann::json& j, const OrderBookSnapshot& snapshot);
void from_json(const nlohmann::json& j, OrderBookSnapshot& snapshot);

}  // namespace domain

// -----------------------------------------------------------------------------
// eventToJson(event)
// -----------------------------------------------------------------------------
// @brief  Wire form of an engine event:
//
//   {"type": "trade_executed" | "order_book_updated" | "order_update",
//    "sequence_id": n, "timestamp_ms": t, "data": {...}}
//
// order_update additionally carries "previous_status" beside "data".
// -----------------------------------------------------------------------------
nlohmann::json eventToJson(const Event& event);

}  // namespace matchcore
