#pragma once

#include "matchcore/domain/decimal.hpp"
#include "matchcore/domain/order.hpp"
#include "matchcore/domain/trade.hpp"

#include <string>
#include <vector>

namespace matchcore {

// -----------------------------------------------------------------------------
// ErrorKind
// -----------------------------------------------------------------------------
// Expected failures of a placement, returned rather than thrown.
//
//   InvalidInput        rejected before the symbol lock; nothing changed
//   PersistenceFailure  the store failed part-way; trades already committed
//                       are kept and listed in the result (partial success)
// -----------------------------------------------------------------------------
enum class ErrorKind {
  None,
  InvalidInput,
  PersistenceFailure,
};

const char* toString(ErrorKind kind);

// -----------------------------------------------------------------------------
// NewOrderRequest
// -----------------------------------------------------------------------------
// What a caller submits. The id and creation time are assigned by
// submitOrder() (store and clock), never by the caller.
// -----------------------------------------------------------------------------
struct NewOrderRequest {
  domain::UserId user_id{};
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  domain::Decimal price;
  domain::Decimal amount;
};

// -----------------------------------------------------------------------------
// PlaceOrderResult
// -----------------------------------------------------------------------------
// Outcome of placeOrder()/submitOrder():
//   order   the taker after matching (final fill and status). On
//           InvalidInput it is the order as submitted.
//   trades  every trade committed by this call, in execution order. On
//           PersistenceFailure this is the partial progress.
//   message human-readable reason when error != None.
// -----------------------------------------------------------------------------
struct PlaceOrderResult {
  ErrorKind error{ErrorKind::None};
  std::string message;
  domain::Order order;
  std::vector<domain::Trade> trades;

  bool ok() const { return error == ErrorKind::None; }

  // Sum of trade amounts; equals order.filled_amount for a fresh order.
  domain::Decimal tradedAmount() const {
    domain::Decimal total;
    for (const auto& trade : trades) {
      total += trade.amount;
    }
    return total;
  }
};

}  // namespace matchcore
