#include "matchcore/engine/exchange_engine.hpp"
#include "matchcore/cache/ttl_book_cache.hpp"
#include "matchcore/codec/json_codec.hpp"
#include "matchcore/store/in_memory_order_store.hpp"
#include "matchcore/store/journal_order_store.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace matchcore {

namespace {

std::unique_ptr<IOrderStore> makeStore(const StoreConfig& config) {
  switch (config.kind) {
    case StoreKind::Journal:
      return std::make_unique<JournalOrderStore>(config.journal_path);
    case StoreKind::Memory:
      break;
  }
  return std::make_unique<InMemoryOrderStore>();
}

std::unique_ptr<IBookCache> makeCache(const CacheConfig& config,
                                      const ITimeProvider& clock) {
  if (config.enabled) {
    return std::make_unique<TtlBookCache>(clock);
  }
  return std::make_unique<NullBookCache>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
ExchangeEngine::ExchangeEngine(EngineConfig config, const ITimeProvider& clock)
    : ExchangeEngine(config, clock, makeStore(config.store),
                     makeCache(config.cache, clock)) {}

ExchangeEngine::ExchangeEngine(EngineConfig config, const ITimeProvider& clock,
                               std::unique_ptr<IOrderStore> store,
                               std::unique_ptr<IBookCache> cache)
    : config_(std::move(config)),
      clock_(clock),
      store_(std::move(store)),
      cache_(std::move(cache)) {
  matching_ = std::make_unique<MatchingEngine>(
      *store_, *cache_, clock_,
      [this](Event event) { forwardNotification(std::move(event)); },
      config_.symbols, config_.cache.ttl_ms);

  std::cout << "[ExchangeEngine] assembled: store="
            << toString(config_.store.kind)
            << " cache=" << (config_.cache.enabled ? "ttl" : "off")
            << " symbols=" << config_.symbols.size() << "\n";
}

ExchangeEngine::~ExchangeEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ExchangeEngine::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Notification loop ------------------------------------------------
  notify_loop_.start();

  const std::size_t dropped = dropped_notifications_.exchange(0);
  if (dropped > 0) {
    std::cerr << "[ExchangeEngine] WARNING: " << dropped
              << " notification(s) dropped while stopped.\n";
  }

  // ---  2) Rebuild books from the store; subscribers see the snapshots ------
  if (!recovered_) {
    try {
      matching_->recover();
    } catch (const std::exception& e) {
      std::cerr << "[ExchangeEngine] ERROR: recovery failed: " << e.what()
                << "\n";
      notify_loop_.stop();
      throw;
    }
    recovered_ = true;
  }

  // ---  3) IPC server (skipped when an endpoint is empty) -------------------
  if (!config_.ipc.command_endpoint.empty() &&
      !config_.ipc.publish_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.command_endpoint, config_.ipc.publish_endpoint);
    try {
      ipc_server_->start();
    } catch (const zmq::error_t& e) {
      std::cerr << "[ExchangeEngine] ERROR: IPC server failed to start: "
                << e.what() << "\n";
      ipc_server_.reset();
      notify_loop_.stop();
      throw;
    }

    ipc_bridge_ = notify_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  running_.store(true);

  std::cout << "[ExchangeEngine] started. Threads: notify"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ExchangeEngine::stop() {
  if (!running_.load()) {
    return;
  }

  // ---  1) Deliver what is queued and join the notification thread ---------
  // The IPC bridge is still attached, so queued events reach the PUB queue.
  notify_loop_.stop();

  // ---  2) Detach the bridge, then publish the rest and join the IPC thread -
  if (ipc_bridge_) {
    notify_loop_.eventBus().unsubscribe(*ipc_bridge_);
    ipc_bridge_.reset();
  }
  ipc_server_.reset();

  running_.store(false);

  std::cout << "[ExchangeEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// forwardNotification(): matching sink
// -----------------------------------------------------------------------------
void ExchangeEngine::forwardNotification(Event event) {
  if (!notify_loop_.isRunning()) {
    // Nothing drains the queue while stopped; count instead of piling up.
    if (dropped_notifications_.fetch_add(1) == 0) {
      std::cerr << "[ExchangeEngine] WARNING: engine is stopped; "
                   "notifications are dropped until start().\n";
    }
    return;
  }
  notify_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// Forwarding
// -----------------------------------------------------------------------------
PlaceOrderResult ExchangeEngine::submitOrder(const NewOrderRequest& request) {
  return matching_->submitOrder(request);
}

PlaceOrderResult ExchangeEngine::placeOrder(domain::Order order) {
  return matching_->placeOrder(std::move(order));
}

bool ExchangeEngine::cancelOrder(domain::OrderId order_id,
                                 domain::UserId user_id) {
  return matching_->cancelOrder(order_id, user_id);
}

std::optional<domain::OrderBookSnapshot> ExchangeEngine::getOrderBook(
    const std::string& symbol) {
  return matching_->getOrderBook(symbol);
}

std::optional<domain::Order> ExchangeEngine::getOrder(
    domain::OrderId id) const {
  return matching_->getOrder(id);
}

std::vector<domain::Order> ExchangeEngine::ordersForUser(
    domain::UserId user_id, std::optional<domain::OrderStatus> status,
    std::optional<std::size_t> limit) const {
  return matching_->ordersForUser(user_id, status, limit);
}

std::vector<domain::Trade> ExchangeEngine::tradesForUser(
    domain::UserId user_id, std::optional<std::string> symbol,
    std::optional<std::size_t> limit) const {
  return matching_->tradesForUser(user_id, std::move(symbol), limit);
}

bool ExchangeEngine::listSymbol(const std::string& symbol) {
  return matching_->listSymbol(symbol);
}

bool ExchangeEngine::resetRollingStats(const std::string& symbol) {
  return matching_->resetRollingStats(symbol);
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC admin requests
// -----------------------------------------------------------------------------
std::string ExchangeEngine::executeCommand(const std::string& cmd) {
  static const std::string kBookPrefix = "BOOK ";

  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["running"] = running_.load();
    response["notification_backlog"] = notify_loop_.backlog();
    response["dropped_notifications"] = dropped_notifications_.load();

    nlohmann::json symbols = nlohmann::json::array();
    for (const auto& symbol : matching_->listedSymbols()) {
      auto snapshot = matching_->publishedSnapshot(symbol);
      if (!snapshot) {
        continue;
      }
      nlohmann::json s;
      s["symbol"] = symbol;
      s["bids"] = snapshot->bids.size();
      s["asks"] = snapshot->asks.size();
      s["last_price"] = snapshot->stats.last_price
                            ? nlohmann::json(*snapshot->stats.last_price)
                            : nlohmann::json(nullptr);
      symbols.push_back(std::move(s));
    }
    response["symbols"] = std::move(symbols);
  } else if (cmd.compare(0, kBookPrefix.size(), kBookPrefix) == 0) {
    const std::string symbol = cmd.substr(kBookPrefix.size());
    if (auto book = matching_->getOrderBook(symbol)) {
      response["status"] = "ok";
      response["book"] = *book;
    } else {
      response["status"] = "error";
      response["response"] = "Unknown symbol: " + symbol;
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace matchcore
