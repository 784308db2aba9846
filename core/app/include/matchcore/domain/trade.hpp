#pragma once

#include "matchcore/domain/decimal.hpp"
#include "matchcore/domain/order.hpp"

#include <cstdint>
#include <string>

namespace matchcore {
namespace domain {

// -----------------------------------------------------------------------------
// Trade
// -----------------------------------------------------------------------------
//
// @brief  One execution between a resting maker order and an incoming taker.
//
// @details
// Created exactly once per match step and never modified afterwards.
//
//   price   is always the maker's limit price, never the taker's.
//   amount  is min(taker remaining, maker remaining) and always > 0.
//
// Buyer/seller ids and buy/sell order ids are resolved from the two sides,
// so a trade always references both orders it consumed regardless of which
// one was the taker. taker_side records the aggressor.
//
// Thread model:
//   Value type. Copied into TradeExecutedEvent and PlaceOrderResult.
// -----------------------------------------------------------------------------
struct Trade {
  TradeId id{};
  std::string symbol;
  Decimal price;
  Decimal amount;
  UserId buyer_user_id{};
  UserId seller_user_id{};
  OrderId buy_order_id{};
  OrderId sell_order_id{};
  Side taker_side{Side::Buy};
  std::int64_t created_at_ms{0};
};

}  // namespace domain
}  // namespace matchcore
