#pragma once

#include "matchcore/book/order_book.hpp"
#include "matchcore/cache/i_book_cache.hpp"
#include "matchcore/concurrent/id_generator.hpp"
#include "matchcore/domain/order.hpp"
#include "matchcore/domain/order_book_snapshot.hpp"
#include "matchcore/domain/order_status.hpp"
#include "matchcore/domain/trade.hpp"
#include "matchcore/events/event.hpp"
#include "matchcore/matching/place_order_result.hpp"
#include "matchcore/store/i_order_store.hpp"
#include "matchcore/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace matchcore {

// -----------------------------------------------------------------------------
// MatchingEngine: price-time priority continuous double auction
// -----------------------------------------------------------------------------
//
// @brief  The only component that mutates orders, trades and order books.
//         Matches incoming limit orders against resting ones, persists the
//         results, and announces them through an event sink.
//
// @details
// Sharding:
//   One SymbolShard per listed symbol, each holding its OrderBook behind its
//   own mutex (the symbol's mutation lock). placeOrder, cancelOrder and
//   resetRollingStats for a symbol serialize on that mutex; different
//   symbols proceed in parallel. The shard map itself is guarded by a
//   shared_mutex and only grows (listSymbol), so a shard pointer stays valid
//   for the engine's lifetime.
//
// placeOrder(order), under the symbol lock:
//   while the taker has a remainder and the best opposite order crosses:
//     1. trade_amount = min(taker remaining, maker remaining),
//        trade_price  = maker price
//     2. store.createTrade            <- commit point of this step
//     3. apply the fill to maker and taker, recompute both statuses,
//        fold the trade into the book aggregates
//     4. emit TradeExecutedEvent; a filled maker leaves the book
//     5. store.updateOrder(maker), store.updateOrder(taker); the maker's
//        OrderUpdateEvent follows once its update is stored
//   then: rest the remainder, save aggregates, invalidate the cache entry,
//   publish a new snapshot (OrderBookUpdatedEvent) and emit the taker's
//   OrderUpdateEvent if its status moved.
//
// Failure semantics:
//   Invalid input is rejected before the lock. A store failure at step 2
//   stops the loop with no change for that step; a failure at step 5 stops
//   it after the step. Either way every trade committed so far stays
//   committed and is returned with ErrorKind::PersistenceFailure. The lock
//   is held across all store calls; it is never released mid-match.
//
// Reads:
//   getOrderBook() never takes a symbol lock. Each mutation publishes an
//   immutable snapshot (shared_ptr<const OrderBookSnapshot>) that readers
//   copy under a short-lived pointer mutex. The cache collaborator sits in
//   front of that and is purely an optimization.
//
// Events:
//   The sink is called while the symbol lock is held, in emission order.
//   It must only enqueue (ExchangeEngine pushes into its notification
//   EventLoopThread); delivery to subscribers happens on another thread, so
//   a subscriber can neither stall matching nor re-enter it under our lock.
//   A throwing sink is logged and ignored.
//
// Thread model:
//   Every public method is safe to call concurrently from any thread.
//
// Ownership:
//   Borrows the store, cache and clock; they must outlive the engine.
// -----------------------------------------------------------------------------
class MatchingEngine {
 public:
  // Receives every event the engine emits. Must not block.
  using EventSink = std::function<void(Event)>;

  static constexpr std::int64_t kDefaultCacheTtlMs = 1000;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  symbols       initial listed symbols
  // @param  cache_ttl_ms  expiry of cached snapshots
  //
  // @throws std::invalid_argument  for a malformed symbol.
  // -------------------------------------------------------------------------
  MatchingEngine(IOrderStore& store, IBookCache& cache,
                 const ITimeProvider& clock, EventSink sink,
                 const std::vector<std::string>& symbols,
                 std::int64_t cache_ttl_ms = kDefaultCacheTtlMs);

  MatchingEngine(const MatchingEngine&) = delete;
  MatchingEngine& operator=(const MatchingEngine&) = delete;

  // -------------------------------------------------------------------------
  // placeOrder(order)
  // -------------------------------------------------------------------------
  // @brief  Matches an order that already exists in the store.
  //
  // @pre    order.id != 0 (assigned by the store), status Pending,
  //         filled_amount 0, price > 0, amount > 0, symbol listed.
  //         Violations return ErrorKind::InvalidInput.
  //
  // Under the symbol lock the order is checked against the store: it must
  // exist there unchanged, still Pending with nothing filled. An order
  // that was placed before (resting, filled, or cut short by a store
  // failure) is rejected as InvalidInput, so a retry never trades twice.
  //
  // @return The taker's final state and the trades produced, in order.
  // -------------------------------------------------------------------------
  PlaceOrderResult placeOrder(domain::Order order);

  // -------------------------------------------------------------------------
  // submitOrder(request)
  // -------------------------------------------------------------------------
  // @brief  Validates, stamps created_at from the clock, creates the order in
  //         the store (which assigns the id), then placeOrder().
  //
  // @details
  // A store failure on create returns PersistenceFailure with no trades and
  // nothing resting.
  // -------------------------------------------------------------------------
  PlaceOrderResult submitOrder(const NewOrderRequest& request);

  // -------------------------------------------------------------------------
  // cancelOrder(order_id, requesting_user_id)
  // -------------------------------------------------------------------------
  // @brief  Cancels a resting order owned by the requester.
  //
  // @return false if the order is unknown, owned by someone else, already
  //         terminal, or the store rejects the update; these cases are
  //         indistinguishable to the caller. true once the order is
  //         persisted as cancelled and removed from the book.
  // -------------------------------------------------------------------------
  bool cancelOrder(domain::OrderId order_id, domain::UserId requesting_user_id);

  // -------------------------------------------------------------------------
  // getOrderBook(symbol)
  // -------------------------------------------------------------------------
  // @brief  Snapshot of a listed symbol; std::nullopt if not listed.
  //
  // @details
  // Cache first. On a miss the latest published snapshot is returned and
  // written back with the configured TTL. Eventually consistent: a racing
  // match may already have made it stale.
  // -------------------------------------------------------------------------
  std::optional<domain::OrderBookSnapshot> getOrderBook(
      const std::string& symbol);

  // Latest published snapshot, bypassing the cache. nullptr if not listed.
  std::shared_ptr<const domain::OrderBookSnapshot> publishedSnapshot(
      const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // recover()
  // -------------------------------------------------------------------------
  // @brief  Rebuilds resting sets and aggregates from the store.
  //
  // @details
  // Loads every Pending/PartiallyFilled order, inserts them oldest first
  // (created_at, then id) into their symbol's book, and restores each
  // symbol's saved aggregates. Orders for unlisted symbols are logged and
  // skipped. Call once, before serving traffic.
  //
  // @return Number of orders put back into a book.
  // @throws StoreError (or whatever the store throws) if loading fails.
  // -------------------------------------------------------------------------
  std::size_t recover();

  // Adds a tradable symbol. Returns false if already listed.
  // @throws std::invalid_argument for a malformed symbol.
  bool listSymbol(const std::string& symbol);

  bool isListed(const std::string& symbol) const;
  std::vector<std::string> listedSymbols() const;

  // Starts a new 24h window for the symbol. false if not listed.
  bool resetRollingStats(const std::string& symbol);

  // -------------------------------------------------------------------------
  // Store-backed queries (StoreError propagates)
  // -------------------------------------------------------------------------
  std::optional<domain::Order> getOrder(domain::OrderId id) const;

  // Newest first, optionally narrowed to one status.
  std::vector<domain::Order> ordersForUser(
      domain::UserId user_id,
      std::optional<domain::OrderStatus> status = std::nullopt,
      std::optional<std::size_t> limit = std::nullopt) const;

  // Trades where the user was buyer or seller, newest first.
  std::vector<domain::Trade> tradesForUser(
      domain::UserId user_id,
      std::optional<std::string> symbol = std::nullopt,
      std::optional<std::size_t> limit = std::nullopt) const;

 private:
  struct SymbolShard {
    explicit SymbolShard(const std::string& symbol);

    std::mutex mutex;  // The symbol's mutation lock; guards book
    OrderBook book;

    mutable std::mutex published_mutex;  // Guards the pointer only
    std::shared_ptr<const domain::OrderBookSnapshot> published;

    // Takers that traded but whose own update never reached the store.
    // Guarded by mutex.
    std::unordered_set<domain::OrderId> unsaved_takers;
  };

  SymbolShard* findShard(const std::string& symbol) const;

  // Reason the order cannot be placed, or std::nullopt. require_id is false
  // for submitOrder(), where the store has not assigned one yet.
  std::optional<std::string> validate(const domain::Order& order,
                                      bool require_id) const;

  PlaceOrderResult reject(domain::Order order, std::string reason) const;

  // Store calls that log and report failure instead of throwing.
  bool persistOrder(const domain::Order& order);
  bool persistStats(const domain::BookStats& stats);

  // Called with shard.mutex held.
  void publishSnapshot(SymbolShard& shard, std::int64_t now_ms);
  void invalidateCache(const std::string& symbol);

  std::optional<domain::OrderBookSnapshot> readCachedBook(
      const std::string& key);

  void emit(Event event);
  Timestamp stamp(std::int64_t now_ms) const;

  IOrderStore& store_;
  IBookCache& cache_;
  const ITimeProvider& clock_;
  EventSink sink_;
  std::int64_t cache_ttl_ms_;

  IdGenerator event_seq_;

  mutable std::shared_mutex shards_mutex_;
  std::unordered_map<std::string, std::unique_ptr<SymbolShard>> shards_;
};

}  // namespace matchcore
