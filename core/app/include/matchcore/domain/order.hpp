#pragma once

#include "matchcore/domain/decimal.hpp"
#include "matchcore/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace matchcore {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId / TradeId / UserId
// -----------------------------------------------------------------------------
// Strong aliases so signatures read as what they carry. Ids are assigned by
// the order store, start at 1, and 0 is reserved as the "unset" sentinel.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;
using TradeId = std::uint64_t;
using UserId = std::uint64_t;

// Longest symbol accepted by validation ("BTC/USDT" style pairs).
constexpr std::size_t kMaxSymbolLength = 20;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

const char* toString(Side side);

// Inverse of toString(Side): "buy" / "sell". std::nullopt otherwise.
std::optional<Side> parseSide(std::string_view text);

// Non-empty, at most kMaxSymbolLength characters, printable ASCII without
// whitespace.
bool isWellFormedSymbol(std::string_view symbol);

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: Full state of one limit order: the immutable intent (user,
// symbol, side, price, amount) plus its cumulative fill and lifecycle status.
//
// @details
// Created by the order store with status Pending and filled_amount 0. The
// authoritative resting copy lives in the symbol's OrderBook and is mutated
// only by the MatchingEngine while it holds that symbol's mutation lock.
// Copies handed out in events and results are snapshots.
//
// Invariant: 0 <= filled_amount <= amount; status agrees with
// statusForFill(filled_amount, amount) unless the order was cancelled.
//
// Why a plain struct:
// - Value semantics: safe to copy into events and across threads.
// - No internal locking; the owning shard's mutex guards the resting copy.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};                              // Assigned by the order store
  UserId user_id{};                          // Owner; only they may cancel
  std::string symbol;                        // e.g. "BTC/USDT"
  Side side{Side::Buy};
  Decimal price;                             // Limit price, > 0
  Decimal amount;                            // Original amount, > 0
  Decimal filled_amount;                     // Cumulative fill
  OrderStatus status{OrderStatus::Pending};
  std::int64_t created_at_ms{0};             // Epoch ms, drives time priority

  Decimal remaining() const { return amount - filled_amount; }
};

}  // namespace domain
}  // namespace matchcore
