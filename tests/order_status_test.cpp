// =============================================================================
// order_status_test.cpp
// =============================================================================
// Unit tests for the order lifecycle helpers in matchcore::domain:
// statusForFill, isLegalTransition, isOpen/isTerminal, the wire names, and
// the symbol/side helpers from order.hpp.
// =============================================================================

#include "matchcore/domain/decimal.hpp"
#include "matchcore/domain/order.hpp"
#include "matchcore/domain/order_status.hpp"

#include <gtest/gtest.h>

#include <string>

using matchcore::domain::Decimal;
using matchcore::domain::OrderStatus;

// -----------------------------------------------------------------------------
// 1. Status is derived from the fill, never chosen by the caller.
// -----------------------------------------------------------------------------
TEST(OrderStatusTest, StatusForFill) {
  const Decimal amount = Decimal::parse("2");

  EXPECT_EQ(matchcore::domain::statusForFill(Decimal(), amount),
            OrderStatus::Pending);
  EXPECT_EQ(matchcore::domain::statusForFill(Decimal::parse("0.5"), amount),
            OrderStatus::PartiallyFilled);
  EXPECT_EQ(matchcore::domain::statusForFill(amount, amount),
            OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// 2. Terminal states have no way out.
// Why: A filled order that could be cancelled would double-release funds in
//      any downstream balance service.
// -----------------------------------------------------------------------------
TEST(OrderStatusTest, TerminalStatesAreFinal) {
  for (auto next : {OrderStatus::Pending, OrderStatus::PartiallyFilled,
                    OrderStatus::Filled, OrderStatus::Cancelled}) {
    EXPECT_FALSE(
        matchcore::domain::isLegalTransition(OrderStatus::Filled, next));
    EXPECT_FALSE(
        matchcore::domain::isLegalTransition(OrderStatus::Cancelled, next));
  }

  EXPECT_TRUE(matchcore::domain::isTerminal(OrderStatus::Filled));
  EXPECT_TRUE(matchcore::domain::isTerminal(OrderStatus::Cancelled));
  EXPECT_TRUE(matchcore::domain::isOpen(OrderStatus::Pending));
  EXPECT_TRUE(matchcore::domain::isOpen(OrderStatus::PartiallyFilled));
}

// -----------------------------------------------------------------------------
// 3. Open states may fill further or be cancelled, never go back to Pending.
// -----------------------------------------------------------------------------
TEST(OrderStatusTest, OpenStateTransitions) {
  using matchcore::domain::isLegalTransition;

  EXPECT_TRUE(isLegalTransition(OrderStatus::Pending,
                                OrderStatus::PartiallyFilled));
  EXPECT_TRUE(isLegalTransition(OrderStatus::Pending, OrderStatus::Filled));
  EXPECT_TRUE(isLegalTransition(OrderStatus::Pending, OrderStatus::Cancelled));
  EXPECT_TRUE(isLegalTransition(OrderStatus::PartiallyFilled,
                                OrderStatus::PartiallyFilled));
  EXPECT_TRUE(isLegalTransition(OrderStatus::PartiallyFilled,
                                OrderStatus::Cancelled));

  EXPECT_FALSE(isLegalTransition(OrderStatus::Pending, OrderStatus::Pending));
  EXPECT_FALSE(isLegalTransition(OrderStatus::PartiallyFilled,
                                 OrderStatus::Pending));
}

// -----------------------------------------------------------------------------
// 4. Wire names parse back; unknown names do not.
// -----------------------------------------------------------------------------
TEST(OrderStatusTest, WireNames) {
  for (auto status : {OrderStatus::Pending, OrderStatus::PartiallyFilled,
                      OrderStatus::Filled, OrderStatus::Cancelled}) {
    auto parsed =
        matchcore::domain::parseOrderStatus(matchcore::domain::toString(status));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, status);
  }
  EXPECT_STREQ(matchcore::domain::toString(OrderStatus::PartiallyFilled),
               "partially_filled");
  EXPECT_FALSE(matchcore::domain::parseOrderStatus("Filled").has_value());

  EXPECT_STREQ(matchcore::domain::toString(matchcore::domain::Side::Sell),
               "sell");
  EXPECT_EQ(matchcore::domain::parseSide("buy"), matchcore::domain::Side::Buy);
  EXPECT_FALSE(matchcore::domain::parseSide("BUY").has_value());
  EXPECT_EQ(matchcore::domain::opposite(matchcore::domain::Side::Buy),
            matchcore::domain::Side::Sell);
}

// -----------------------------------------------------------------------------
// 5. Symbols: 1..20 printable characters, no whitespace.
// -----------------------------------------------------------------------------
TEST(OrderStatusTest, SymbolShape) {
  using matchcore::domain::isWellFormedSymbol;

  EXPECT_TRUE(isWellFormedSymbol("BTC/USDT"));
  EXPECT_TRUE(isWellFormedSymbol(std::string(20, 'X')));

  EXPECT_FALSE(isWellFormedSymbol(""));
  EXPECT_FALSE(isWellFormedSymbol(std::string(21, 'X')));
  EXPECT_FALSE(isWellFormedSymbol("BTC USDT"));
  EXPECT_FALSE(isWellFormedSymbol("BTC\tUSDT"));
}

// -----------------------------------------------------------------------------
// 6. remaining() is amount minus filled.
// -----------------------------------------------------------------------------
TEST(OrderStatusTest, OrderRemaining) {
  matchcore::domain::Order order;
  order.amount = Decimal::parse("1.5");
  order.filled_amount = Decimal::parse("0.4");
  EXPECT_EQ(order.remaining(), Decimal::parse("1.1"));
}
