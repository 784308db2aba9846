#include "matchcore/domain/order_status.hpp"

namespace matchcore {
namespace domain {

// -----------------------------------------------------------------------------
// isTerminal / isOpen
// -----------------------------------------------------------------------------
bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled || status == OrderStatus::Cancelled;
}

bool isOpen(OrderStatus status) { return !isTerminal(status); }

// -----------------------------------------------------------------------------
// statusForFill
// -----------------------------------------------------------------------------
OrderStatus statusForFill(const Decimal& filled, const Decimal& amount) {
  if (filled.isZero()) {
    return OrderStatus::Pending;
  }
  if (filled >= amount) {
    return OrderStatus::Filled;
  }
  return OrderStatus::PartiallyFilled;
}

// -----------------------------------------------------------------------------
// isLegalTransition: the full edge list of the lifecycle graph
// -----------------------------------------------------------------------------
bool isLegalTransition(OrderStatus current, OrderStatus next) {
  using S = OrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled;

    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled;

    case S::Filled:
    case S::Cancelled:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// toString / parseOrderStatus
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Pending:         return "pending";
    case S::PartiallyFilled: return "partially_filled";
    case S::Filled:          return "filled";
    case S::Cancelled:       return "cancelled";
  }
  return "unknown";
}

std::optional<OrderStatus> parseOrderStatus(std::string_view text) {
  if (text == "pending") return OrderStatus::Pending;
  if (text == "partially_filled") return OrderStatus::PartiallyFilled;
  if (text == "filled") return OrderStatus::Filled;
  if (text == "cancelled") return OrderStatus::Cancelled;
  return std::nullopt;
}

}  // namespace domain
}  // namespace matchcore
