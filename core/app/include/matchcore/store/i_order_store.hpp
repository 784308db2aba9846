#pragma once

#include "matchcore/domain/book_stats.hpp"
#include "matchcore/domain/order.hpp"
#include "matchcore/domain/order_status.hpp"
#include "matchcore/domain/trade.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace matchcore {

// -----------------------------------------------------------------------------
// StoreError
// -----------------------------------------------------------------------------
// Raised by IOrderStore implementations when the backing storage cannot
// complete a call (I/O failure, unknown id on update, unreadable journal).
// The MatchingEngine treats any exception from the store as a persistence
// failure of that call.
// -----------------------------------------------------------------------------
class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// OrderFilter / TradeFilter
// -----------------------------------------------------------------------------
// Range-query predicates. Unset fields match everything; an empty status
// list matches every status. Results are always newest first
// (created_at_ms descending, then id descending) and truncated to limit.
// -----------------------------------------------------------------------------
struct OrderFilter {
  std::optional<std::string> symbol;
  std::optional<domain::UserId> user_id;
  std::vector<domain::OrderStatus> statuses;
  std::optional<std::size_t> limit;

  bool matches(const domain::Order& order) const;
};

struct TradeFilter {
  std::optional<std::string> symbol;
  std::optional<domain::UserId> user_id;  // Matches buyer OR seller
  std::optional<std::size_t> limit;

  bool matches(const domain::Trade& trade) const;
};

// -----------------------------------------------------------------------------
// IOrderStore: persistence collaborator
// -----------------------------------------------------------------------------
//
// @brief  Durable storage for orders, trades and per-symbol aggregates.
//
// @details
// Each call is one transaction: it either completes or throws, never half
// applies. There is no transaction spanning calls; the MatchingEngine orders
// its calls so that a failure at any point leaves committed trades valid.
//
//   createOrder   assigns a fresh id (> 0), stores, returns the stored copy
//   updateOrder   replaces the stored order with the same id; throws
//                 StoreError if the id is unknown
//   createTrade   assigns a fresh id (> 0), stores, returns the stored copy
//
// Thread model:
//   Implementations must be safe for concurrent calls from any thread. The
//   engine calls them from every matching thread at once (one per symbol).
//
// Ownership:
//   Owned by ExchangeEngine; MatchingEngine holds a reference.
// -----------------------------------------------------------------------------
class IOrderStore {
 public:
  virtual ~IOrderStore() = default;

  virtual domain::Order createOrder(domain::Order order) = 0;
  virtual void updateOrder(const domain::Order& order) = 0;
  virtual std::optional<domain::Order> getOrder(domain::OrderId id) const = 0;

  virtual domain::Trade createTrade(domain::Trade trade) = 0;

  virtual std::vector<domain::Order> findOrders(
      const OrderFilter& filter) const = 0;
  virtual std::vector<domain::Trade> findTrades(
      const TradeFilter& filter) const = 0;

  // Upsert of one symbol's aggregates.
  virtual void saveBookStats(const domain::BookStats& stats) = 0;
  virtual std::optional<domain::BookStats> loadBookStats(
      const std::string& symbol) const = 0;
};

}  // namespace matchcore
