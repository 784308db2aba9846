#include "matchcore/book/order_book.hpp"

#include <stdexcept>
#include <utility>

namespace matchcore {

using domain::Decimal;
using domain::Order;
using domain::Side;

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderBook::OrderBook(std::string symbol) { stats_.symbol = std::move(symbol); }

// -----------------------------------------------------------------------------
// addResting()
// -----------------------------------------------------------------------------
void OrderBook::addResting(const Order& order) {
  if (order.symbol != stats_.symbol) {
    throw std::invalid_argument("order " + std::to_string(order.id) +
                                " is for " + order.symbol + ", not " +
                                stats_.symbol);
  }
  if (!domain::isOpen(order.status) || !order.remaining().isPositive()) {
    throw std::invalid_argument("order " + std::to_string(order.id) +
                                " is not open and cannot rest");
  }

  auto [it, inserted] = orders_.emplace(order.id, order);
  if (!inserted) {
    throw std::invalid_argument("order " + std::to_string(order.id) +
                                " is already resting");
  }

  if (order.side == Side::Buy) {
    bids_.insert(keyOf(order));
  } else {
    asks_.insert(keyOf(order));
  }
}

// -----------------------------------------------------------------------------
// removeResting()
// -----------------------------------------------------------------------------
bool OrderBook::removeResting(domain::OrderId id) {
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return false;
  }

  const BookKey key = keyOf(it->second);
  if (it->second.side == Side::Buy) {
    bids_.erase(key);
  } else {
    asks_.erase(key);
  }
  orders_.erase(it);
  return true;
}

// -----------------------------------------------------------------------------
// findResting()
// -----------------------------------------------------------------------------
Order* OrderBook::findResting(domain::OrderId id) {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

const Order* OrderBook::findResting(domain::OrderId id) const {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

// -----------------------------------------------------------------------------
// bestCandidate(): head of the opposite side, if it crosses
// -----------------------------------------------------------------------------
Order* OrderBook::bestCandidate(Side taker_side, const Decimal& limit_price) {
  if (taker_side == Side::Buy) {
    if (asks_.empty() || asks_.begin()->price > limit_price) {
      return nullptr;
    }
    return findResting(asks_.begin()->id);
  }

  if (bids_.empty() || bids_.begin()->price < limit_price) {
    return nullptr;
  }
  return findResting(bids_.begin()->id);
}

// -----------------------------------------------------------------------------
// updateOnTrade()
// -----------------------------------------------------------------------------
void OrderBook::updateOnTrade(const Decimal& price, const Decimal& amount,
                              std::int64_t now_ms) {
  // Compute the new volume first so an overflow leaves the stats untouched.
  const Decimal volume = stats_.volume_24h + amount;

  stats_.last_price = price;
  stats_.high_24h = stats_.high_24h ? domain::max(*stats_.high_24h, price)
                                    : price;
  stats_.low_24h = stats_.low_24h ? domain::min(*stats_.low_24h, price)
                                  : price;
  stats_.volume_24h = volume;
  stats_.updated_at_ms = now_ms;
}

// -----------------------------------------------------------------------------
// resetRollingStats()
// -----------------------------------------------------------------------------
void OrderBook::resetRollingStats(std::int64_t now_ms) {
  stats_.volume_24h = Decimal{};
  stats_.high_24h.reset();
  stats_.low_24h.reset();
  stats_.updated_at_ms = now_ms;
}

// -----------------------------------------------------------------------------
// restoreStats()
// -----------------------------------------------------------------------------
void OrderBook::restoreStats(const domain::BookStats& stats) {
  std::string symbol = stats_.symbol;
  stats_ = stats;
  stats_.symbol = std::move(symbol);
}

// -----------------------------------------------------------------------------
// snapshot()
// -----------------------------------------------------------------------------
template <typename SideSet>
void OrderBook::appendEntries(const SideSet& side,
                              std::vector<domain::BookEntry>& out) const {
  out.reserve(side.size());
  for (const BookKey& key : side) {
    const Order& order = orders_.at(key.id);
    out.push_back(domain::BookEntry{order.id, order.price, order.remaining(),
                                    order.created_at_ms});
  }
}

domain::OrderBookSnapshot OrderBook::snapshot() const {
  domain::OrderBookSnapshot snap;
  snap.stats = stats_;
  appendEntries(bids_, snap.bids);
  appendEntries(asks_, snap.asks);
  return snap;
}

}  // namespace matchcore
