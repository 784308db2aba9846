#include "matchcore/store/i_order_store.hpp"

#include <algorithm>

namespace matchcore {

// -----------------------------------------------------------------------------
// Filters
// -----------------------------------------------------------------------------
bool OrderFilter::matches(const domain::Order& order) const {
  if (symbol && order.symbol != *symbol) {
    return false;
  }
  if (user_id && order.user_id != *user_id) {
    return false;
  }
  if (!statuses.empty() &&
      std::find(statuses.begin(), statuses.end(), order.status) ==
          statuses.end()) {
    return false;
  }
  return true;
}

bool TradeFilter::matches(const domain::Trade& trade) const {
  if (symbol && trade.symbol != *symbol) {
    return false;
  }
  if (user_id && trade.buyer_user_id != *user_id &&
      trade.seller_user_id != *user_id) {
    return false;
  }
  return true;
}

}  // namespace matchcore
