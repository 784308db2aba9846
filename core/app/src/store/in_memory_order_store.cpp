#include "matchcore/store/in_memory_order_store.hpp"

#include <algorithm>

namespace matchcore {

using domain::Order;
using domain::Trade;

namespace {

// Newest first: created_at descending, then id descending.
template <typename Record>
bool newerFirst(const Record& a, const Record& b) {
  if (a.created_at_ms != b.created_at_ms) {
    return a.created_at_ms > b.created_at_ms;
  }
  return a.id > b.id;
}

template <typename Record>
void sortAndTruncate(std::vector<Record>& records,
                     const std::optional<std::size_t>& limit) {
  std::sort(records.begin(), records.end(), newerFirst<Record>);
  if (limit && records.size() > *limit) {
    records.resize(*limit);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
Order InMemoryOrderStore::createOrder(Order order) {
  std::lock_guard lock(mutex_);
  order.id = order_ids_.next_id();
  orders_[order.id] = order;
  return order;
}

void InMemoryOrderStore::updateOrder(const Order& order) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order.id);
  if (it == orders_.end()) {
    throw StoreError("updateOrder: unknown order id " +
                     std::to_string(order.id));
  }
  it->second = order;
}

std::optional<Order> InMemoryOrderStore::getOrder(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryOrderStore::restoreOrder(const Order& order) {
  if (order.id == 0) {
    throw StoreError("restoreOrder: order id 0 is reserved");
  }
  std::lock_guard lock(mutex_);
  orders_[order.id] = order;
  order_ids_.advancePast(order.id);
}

// -----------------------------------------------------------------------------
// Trades
// -----------------------------------------------------------------------------
Trade InMemoryOrderStore::createTrade(Trade trade) {
  std::lock_guard lock(mutex_);
  trade.id = trade_ids_.next_id();
  trades_[trade.id] = trade;
  return trade;
}

void InMemoryOrderStore::restoreTrade(const Trade& trade) {
  if (trade.id == 0) {
    throw StoreError("restoreTrade: trade id 0 is reserved");
  }
  std::lock_guard lock(mutex_);
  trades_[trade.id] = trade;
  trade_ids_.advancePast(trade.id);
}

// -----------------------------------------------------------------------------
// Range queries
// -----------------------------------------------------------------------------
std::vector<Order> InMemoryOrderStore::findOrders(
    const OrderFilter& filter) const {
  std::vector<Order> result;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, order] : orders_) {
      if (filter.matches(order)) {
        result.push_back(order);
      }
    }
  }
  sortAndTruncate(result, filter.limit);
  return result;
}

std::vector<Trade> InMemoryOrderStore::findTrades(
    const TradeFilter& filter) const {
  std::vector<Trade> result;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, trade] : trades_) {
      if (filter.matches(trade)) {
        result.push_back(trade);
      }
    }
  }
  sortAndTruncate(result, filter.limit);
  return result;
}

// -----------------------------------------------------------------------------
// Book aggregates
// -----------------------------------------------------------------------------
void InMemoryOrderStore::saveBookStats(const domain::BookStats& stats) {
  std::lock_guard lock(mutex_);
  book_stats_[stats.symbol] = stats;
}

std::optional<domain::BookStats> InMemoryOrderStore::loadBookStats(
    const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = book_stats_.find(symbol);
  if (it == book_stats_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t InMemoryOrderStore::orderCount() const {
  std::lock_guard lock(mutex_);
  return orders_.size();
}

std::size_t InMemoryOrderStore::tradeCount() const {
  std::lock_guard lock(mutex_);
  return trades_.size();
}

}  // namespace matchcore
