#pragma once

#include "matchcore/cache/i_book_cache.hpp"
#include "matchcore/concurrent/event_loop_thread.hpp"
#include "matchcore/config/engine_config.hpp"
#include "matchcore/eventbus/event_bus.hpp"
#include "matchcore/matching/matching_engine.hpp"
#include "matchcore/network/ipc_server.hpp"
#include "matchcore/store/i_order_store.hpp"
#include "matchcore/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace matchcore {

// -----------------------------------------------------------------------------
// ExchangeEngine
// -----------------------------------------------------------------------------
//
// @brief  Assembles an exchange from an EngineConfig and owns its parts:
//         store, cache, matching engine, notification loop, IPC server.
//
// @details
// Thread layout:
//
//   caller threads       placeOrder / submitOrder / cancelOrder / queries,
//                        straight into MatchingEngine (per-symbol locks)
//   notify_loop thread   drains the event queue and publishes each event on
//                        notificationBus(); subscribers run here
//   ipc thread           IpcServer: PUB telemetry and REP commands
//
//   MatchingEngine's sink only pushes into notify_loop_, so matching never
//   waits on a subscriber.
//
// Lifecycle:
//   The constructor builds everything but spawns no thread. start() runs
//   store recovery (first start only), starts the notification loop, then
//   the IPC server if both endpoints are configured. stop() drains queued
//   notifications before closing the IPC server. Orders may be placed before
//   start(); their events queue up and are delivered once the loop runs.
//
// Ownership:
//   ExchangeEngine
//    ├── config_        (EngineConfig, value)
//    ├── clock_         (const ITimeProvider&, non-owning)
//    ├── store_         (unique_ptr<IOrderStore>)
//    ├── cache_         (unique_ptr<IBookCache>)
//    ├── notify_loop_   (EventLoopThread, value)
//    ├── matching_      (unique_ptr<MatchingEngine>; borrows the above)
//    └── ipc_server_    (unique_ptr<IpcServer>)
//
// Members are declared so that matching_ is destroyed before the store,
// cache and loop it refers to.
// -----------------------------------------------------------------------------
class ExchangeEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // Builds the store named by config.store (InMemoryOrderStore or
  // JournalOrderStore) and a TtlBookCache, or NullBookCache when the cache
  // is disabled.
  //
  // @throws StoreError            if the journal cannot be opened.
  // @throws std::invalid_argument for a malformed symbol.
  // -------------------------------------------------------------------------
  ExchangeEngine(EngineConfig config, const ITimeProvider& clock);

  // Same, with caller-supplied collaborators (tests, custom backends).
  ExchangeEngine(EngineConfig config, const ITimeProvider& clock,
                 std::unique_ptr<IOrderStore> store,
                 std::unique_ptr<IBookCache> cache);

  ~ExchangeEngine();

  ExchangeEngine(const ExchangeEngine&) = delete;
  ExchangeEngine& operator=(const ExchangeEngine&) = delete;
  ExchangeEngine(ExchangeEngine&&) = delete;
  ExchangeEngine& operator=(ExchangeEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // 1. start the notification loop
  // 2. recover() from the store (first start only); the restored snapshots
  //    reach subscribers attached before start()
  // 3. start the IpcServer and bridge notifications to its PUB socket
  //
  // Events emitted while the engine is stopped are dropped and counted
  // (droppedNotifications(), STATUS "dropped_notifications"); order entry
  // itself keeps working.
  //
  // Idempotent.
  // @throws StoreError if recovery cannot read the store.
  // @throws zmq::error_t if an IPC endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Stops the notification loop (after delivering what is queued), then
  // the IPC server. Idempotent; start() may be called again.
  void stop();

  bool isRunning() const { return running_.load(); }

  // --- Order entry and queries (see MatchingEngine) --------------------------
  PlaceOrderResult submitOrder(const NewOrderRequest& request);
  PlaceOrderResult placeOrder(domain::Order order);
  bool cancelOrder(domain::OrderId order_id, domain::UserId user_id);
  std::optional<domain::OrderBookSnapshot> getOrderBook(
      const std::string& symbol);

  std::optional<domain::Order> getOrder(domain::OrderId id) const;
  std::vector<domain::Order> ordersForUser(
      domain::UserId user_id,
      std::optional<domain::OrderStatus> status = std::nullopt,
      std::optional<std::size_t> limit = std::nullopt) const;
  std::vector<domain::Trade> tradesForUser(
      domain::UserId user_id,
      std::optional<std::string> symbol = std::nullopt,
      std::optional<std::size_t> limit = std::nullopt) const;

  bool listSymbol(const std::string& symbol);
  bool resetRollingStats(const std::string& symbol);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // Admin commands received on the IPC REP socket:
  //
  //   "PING"           {"status":"ok","response":"PONG"}
  //   "STATUS"         {"status":"ok","running":b,"notification_backlog":n,
  //                     "dropped_notifications":n,
  //                     "symbols":[{"symbol","bids","asks","last_price"}]}
  //   "BOOK <symbol>"  {"status":"ok","book":{...snapshot...}}
  //   anything else    {"status":"error","response":"..."}
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Bus on which every engine event is delivered (notification thread).
  EventBus& notificationBus() { return notify_loop_.eventBus(); }

  // Events discarded because the engine was stopped, since the last start().
  std::size_t droppedNotifications() const {
    return dropped_notifications_.load();
  }

  const EngineConfig& config() const { return config_; }
  MatchingEngine& matching() { return *matching_; }
  IOrderStore& store() { return *store_; }

 private:
  // MatchingEngine's sink: queues for the notification loop, or drops the
  // event while the loop is stopped.
  void forwardNotification(Event event);

  EngineConfig config_;
  const ITimeProvider& clock_;

  std::unique_ptr<IOrderStore> store_;
  std::unique_ptr<IBookCache> cache_;

  EventLoopThread notify_loop_;
  std::atomic<std::size_t> dropped_notifications_{0};  // Before matching_
  std::unique_ptr<MatchingEngine> matching_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::optional<EventBus::SubscriptionId> ipc_bridge_;

  std::atomic<bool> running_{false};  // Read by STATUS on the IPC thread
  bool recovered_{false};
};

}  // namespace matchcore
