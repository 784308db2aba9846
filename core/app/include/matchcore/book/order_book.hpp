#pragma once

#include "matchcore/domain/book_stats.hpp"
#include "matchcore/domain/decimal.hpp"
#include "matchcore/domain/order.hpp"
#include "matchcore/domain/order_book_snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace matchcore {

// -----------------------------------------------------------------------------
// OrderBook: resting orders and trade aggregates of one symbol
// -----------------------------------------------------------------------------
//
// @brief  Holds the authoritative resting-order set and the BookStats for a
//         single symbol, and answers "which maker does this taker hit next".
//
// @details
// Storage:
//   orders_  unordered_map<OrderId, Order>: the resting orders themselves,
//            including their mutable fill state.
//   bids_    std::set of (price, created_at, id) keys, best bid first:
//            price descending, then created_at ascending, then id ascending.
//   asks_    same keys, best ask first: price ascending, then created_at
//            ascending, then id ascending.
//
// The key fields of an order never change while it rests, so a fill mutates
// the Order in orders_ in place and the key sets stay valid. The set order
// IS the price-time priority used by matching and the order of the snapshot
// views; there is a single definition of the tie-break.
//
// Only open orders (Pending / PartiallyFilled with remaining > 0) rest here.
// The MatchingEngine removes a maker the moment it fills, and removes a
// cancelled order under the same lock, so every order in the book is a
// valid candidate.
//
// Thread model:
//   Not thread-safe. Owned by a MatchingEngine SymbolShard and touched only
//   under that shard's mutex.
// -----------------------------------------------------------------------------
class OrderBook {
 public:
  explicit OrderBook(std::string symbol);

  OrderBook(const OrderBook&) = delete;
  OrderBook& operator=(const OrderBook&) = delete;

  const std::string& symbol() const { return stats_.symbol; }

  // -------------------------------------------------------------------------
  // addResting(order)
  // -------------------------------------------------------------------------
  // @brief  Inserts an open order into its side.
  //
  // @throws std::invalid_argument  if the order belongs to another symbol,
  //                                is terminal, has nothing remaining, or an
  //                                order with the same id already rests.
  // -------------------------------------------------------------------------
  void addResting(const domain::Order& order);

  // Removes the order from its side. Returns false if it was not resting.
  bool removeResting(domain::OrderId id);

  // Pointer to the live resting order, nullptr if absent. Valid until the
  // order is removed.
  domain::Order* findResting(domain::OrderId id);
  const domain::Order* findResting(domain::OrderId id) const;

  // -------------------------------------------------------------------------
  // bestCandidate(taker_side, limit_price)
  // -------------------------------------------------------------------------
  // @brief  Highest-priority resting order on the opposite side that crosses
  //         the taker's limit, or nullptr.
  //
  // @details
  //   taker Buy  -> best ask, if ask.price <= limit_price
  //   taker Sell -> best bid, if bid.price >= limit_price
  // Because the sides are sorted best-first, checking only the head is
  // enough: if the best opposite order does not cross, nothing does.
  // -------------------------------------------------------------------------
  domain::Order* bestCandidate(domain::Side taker_side,
                               const domain::Decimal& limit_price);

  // -------------------------------------------------------------------------
  // updateOnTrade(price, amount, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Folds one trade into the aggregates.
  //
  // @details
  // last_price = price; high = max(high, price); low = min(low, price), the
  // first trade initializing both; volume_24h += amount. Append-only: high
  // never decreases and low never increases until resetRollingStats().
  //
  // @throws std::overflow_error  if volume_24h would overflow.
  // -------------------------------------------------------------------------
  void updateOnTrade(const domain::Decimal& price,
                     const domain::Decimal& amount, std::int64_t now_ms);

  // Clears volume/high/low for a new 24h window; last_price is kept.
  void resetRollingStats(std::int64_t now_ms);

  // Replaces the aggregates with persisted ones (start-up recovery). The
  // symbol of the book is kept regardless of stats.symbol.
  void restoreStats(const domain::BookStats& stats);

  const domain::BookStats& stats() const { return stats_; }

  // Point-in-time copy of aggregates and both sides, best first.
  domain::OrderBookSnapshot snapshot() const;

  std::size_t bidCount() const { return bids_.size(); }
  std::size_t askCount() const { return asks_.size(); }
  std::size_t restingCount() const { return orders_.size(); }

 private:
  struct BookKey {
    domain::Decimal price;
    std::int64_t created_at_ms{0};
    domain::OrderId id{};
  };

  // Best bid first: higher price, then earlier, then lower id.
  struct BidPriority {
    bool operator()(const BookKey& a, const BookKey& b) const {
      if (a.price != b.price) return a.price > b.price;
      if (a.created_at_ms != b.created_at_ms)
        return a.created_at_ms < b.created_at_ms;
      return a.id < b.id;
    }
  };

  // Best ask first: lower price, then earlier, then lower id.
  struct AskPriority {
    bool operator()(const BookKey& a, const BookKey& b) const {
      if (a.price != b.price) return a.price < b.price;
      if (a.created_at_ms != b.created_at_ms)
        return a.created_at_ms < b.created_at_ms;
      return a.id < b.id;
    }
  };

  static BookKey keyOf(const domain::Order& order) {
    return BookKey{order.price, order.created_at_ms, order.id};
  }

  template <typename SideSet>
  void appendEntries(const SideSet& side,
                     std::vector<domain::BookEntry>& out) const;

  domain::BookStats stats_;
  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::set<BookKey, BidPriority> bids_;
  std::set<BookKey, AskPriority> asks_;
};

}  // namespace matchcore
