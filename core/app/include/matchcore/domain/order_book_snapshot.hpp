#pragma once

#include "matchcore/domain/book_stats.hpp"
#include "matchcore/domain/decimal.hpp"
#include "matchcore/domain/order.hpp"

#include <cstdint>
#include <vector>

namespace matchcore {
namespace domain {

// One resting order as seen from outside the book.
struct BookEntry {
  OrderId order_id{};
  Decimal price;
  Decimal remaining;
  std::int64_t created_at_ms{0};
};

// -----------------------------------------------------------------------------
// OrderBookSnapshot
// -----------------------------------------------------------------------------
// Responsibility: Immutable, point-in-time copy of one symbol's book:
// aggregates plus both sides of resting orders in matching priority order.
//
//   bids: price descending, then created_at ascending, then id ascending
//   asks: price ascending,  then created_at ascending, then id ascending
//
// The first entry of each side is the order the next opposite taker would
// hit. Snapshots are published behind a shared_ptr<const ...> so readers
// never touch the live book.
// -----------------------------------------------------------------------------
struct OrderBookSnapshot {
  BookStats stats;
  std::vector<BookEntry> bids;
  std::vector<BookEntry> asks;
};

}  // namespace domain
}  // namespace matchcore
