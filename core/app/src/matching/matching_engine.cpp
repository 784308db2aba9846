#include "matchcore/matching/matching_engine.hpp"
#include "matchcore/codec/json_codec.hpp"
#include "matchcore/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace matchcore {

using domain::Decimal;
using domain::Order;
using domain::OrderStatus;
using domain::Side;
using domain::Trade;

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:               return "none";
    case ErrorKind::InvalidInput:       return "invalid_input";
    case ErrorKind::PersistenceFailure: return "persistence_failure";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// SymbolShard
// -----------------------------------------------------------------------------
MatchingEngine::SymbolShard::SymbolShard(const std::string& symbol)
    : book(symbol),
      published(std::make_shared<const domain::OrderBookSnapshot>(
          book.snapshot())) {}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
MatchingEngine::MatchingEngine(IOrderStore& store, IBookCache& cache,
                               const ITimeProvider& clock, EventSink sink,
                               const std::vector<std::string>& symbols,
                               std::int64_t cache_ttl_ms)
    : store_(store),
      cache_(cache),
      clock_(clock),
      sink_(std::move(sink)),
      cache_ttl_ms_(cache_ttl_ms) {
  for (const auto& symbol : symbols) {
    listSymbol(symbol);
  }
}

// -----------------------------------------------------------------------------
// Symbols
// -----------------------------------------------------------------------------
bool MatchingEngine::listSymbol(const std::string& symbol) {
  if (!domain::isWellFormedSymbol(symbol)) {
    throw std::invalid_argument("malformed symbol '" + symbol + "'");
  }

  std::unique_lock lock(shards_mutex_);
  if (shards_.count(symbol) != 0) {
    return false;
  }
  shards_.emplace(symbol, std::make_unique<SymbolShard>(symbol));
  std::cout << "[MatchingEngine] listed " << symbol << "\n";
  return true;
}

bool MatchingEngine::isListed(const std::string& symbol) const {
  return findShard(symbol) != nullptr;
}

std::vector<std::string> MatchingEngine::listedSymbols() const {
  std::vector<std::string> symbols;
  {
    std::shared_lock lock(shards_mutex_);
    symbols.reserve(shards_.size());
    for (const auto& [symbol, shard] : shards_) {
      symbols.push_back(symbol);
    }
  }
  std::sort(symbols.begin(), symbols.end());
  return symbols;
}

MatchingEngine::SymbolShard* MatchingEngine::findShard(
    const std::string& symbol) const {
  std::shared_lock lock(shards_mutex_);
  auto it = shards_.find(symbol);
  return it == shards_.end() ? nullptr : it->second.get();
}

// -----------------------------------------------------------------------------
// validate(): every precondition that can be checked without the lock
// -----------------------------------------------------------------------------
std::optional<std::string> MatchingEngine::validate(const Order& order,
                                                    bool require_id) const {
  if (!domain::isWellFormedSymbol(order.symbol)) {
    return "malformed symbol '" + order.symbol + "'";
  }
  if (!isListed(order.symbol)) {
    return "symbol '" + order.symbol + "' is not listed";
  }
  if (!order.price.isPositive()) {
    return "price must be positive";
  }
  if (!order.amount.isPositive()) {
    return "amount must be positive";
  }
  if (order.status != OrderStatus::Pending) {
    return std::string("order must be pending, not ") +
           domain::toString(order.status);
  }
  if (!order.filled_amount.isZero()) {
    return "a new order cannot be partially filled";
  }
  if (require_id && order.id == 0) {
    return "order has no id";
  }
  return std::nullopt;
}

PlaceOrderResult MatchingEngine::reject(Order order,
                                        std::string reason) const {
  std::cerr << "[MatchingEngine] rejected order " << order.id << " ("
            << order.symbol << "): " << reason << "\n";
  PlaceOrderResult result;
  result.error = ErrorKind::InvalidInput;
  result.message = std::move(reason);
  result.order = std::move(order);
  return result;
}

// -----------------------------------------------------------------------------
// submitOrder(): create in the store, then match
// -----------------------------------------------------------------------------
PlaceOrderResult MatchingEngine::submitOrder(const NewOrderRequest& request) {
  Order order;
  order.user_id = request.user_id;
  order.symbol = request.symbol;
  order.side = request.side;
  order.price = request.price;
  order.amount = request.amount;
  order.status = OrderStatus::Pending;
  order.created_at_ms = clock_.now_ms();

  if (auto reason = validate(order, /*require_id=*/false)) {
    return reject(std::move(order), std::move(*reason));
  }

  try {
    order = store_.createOrder(order);
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] ERROR: could not create order for user "
              << order.user_id << " on " << order.symbol << ": " << e.what()
              << "\n";
    PlaceOrderResult result;
    result.error = ErrorKind::PersistenceFailure;
    result.message = std::string("create order failed: ") + e.what();
    result.order = std::move(order);
    return result;
  }

  return placeOrder(std::move(order));
}

// -----------------------------------------------------------------------------
// placeOrder(): the matching loop
// -----------------------------------------------------------------------------
PlaceOrderResult MatchingEngine::placeOrder(Order order) {
  if (auto reason = validate(order, /*require_id=*/true)) {
    return reject(std::move(order), std::move(*reason));
  }

  SymbolShard* shard = findShard(order.symbol);
  if (shard == nullptr) {
    return reject(std::move(order), "symbol is not listed");
  }

  PlaceOrderResult result;

  std::lock_guard lock(shard->mutex);
  OrderBook& book = shard->book;

  if (book.findResting(order.id) != nullptr ||
      shard->unsaved_takers.count(order.id) != 0) {
    return reject(std::move(order), "order was already placed");
  }

  // The store decides whether this order was placed before; a stale pending
  // copy of a filled or partly matched order must not match again.
  std::optional<Order> stored;
  try {
    stored = store_.getOrder(order.id);
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] ERROR: could not read order " << order.id
              << " before matching: " << e.what() << "\n";
    result.error = ErrorKind::PersistenceFailure;
    result.message = std::string("read order failed: ") + e.what();
    result.order = std::move(order);
    return result;
  }
  if (!stored) {
    return reject(std::move(order), "order is not in the store");
  }
  if (stored->status != OrderStatus::Pending ||
      !stored->filled_amount.isZero()) {
    return reject(std::move(order),
                  std::string("order was already placed (status ") +
                      domain::toString(stored->status) + ")");
  }
  if (stored->user_id != order.user_id || stored->symbol != order.symbol ||
      stored->side != order.side || stored->price != order.price ||
      stored->amount != order.amount) {
    return reject(std::move(order), "order does not match the stored record");
  }

  const OrderStatus taker_initial = order.status;
  bool taker_stored = true;

  while (order.remaining().isPositive()) {
    Order* maker = book.bestCandidate(order.side, order.price);
    if (maker == nullptr) {
      break;
    }

    const Decimal trade_amount =
        domain::min(order.remaining(), maker->remaining());
    const std::int64_t now = clock_.now_ms();

    const bool taker_buys = (order.side == Side::Buy);
    const Order& buy = taker_buys ? order : *maker;
    const Order& sell = taker_buys ? *maker : order;

    Trade trade;
    trade.symbol = order.symbol;
    trade.price = maker->price;
    trade.amount = trade_amount;
    trade.buyer_user_id = buy.user_id;
    trade.seller_user_id = sell.user_id;
    trade.buy_order_id = buy.id;
    trade.sell_order_id = sell.id;
    trade.taker_side = order.side;
    trade.created_at_ms = now;

    // Commit point: nothing in memory changes unless the trade is stored.
    try {
      trade = store_.createTrade(trade);
    } catch (const std::exception& e) {
      std::cerr << "[MatchingEngine] ERROR: createTrade failed for order "
                << order.id << " against " << maker->id << ": " << e.what()
                << "\n";
      result.error = ErrorKind::PersistenceFailure;
      result.message = std::string("create trade failed: ") + e.what();
      break;
    }

    const OrderStatus maker_previous = maker->status;
    maker->filled_amount += trade_amount;
    maker->status = domain::statusForFill(maker->filled_amount, maker->amount);
    order.filled_amount += trade_amount;
    order.status = domain::statusForFill(order.filled_amount, order.amount);

    try {
      book.updateOnTrade(trade.price, trade.amount, now);
    } catch (const std::overflow_error& e) {
      std::cerr << "[MatchingEngine] ERROR: aggregates of " << order.symbol
                << " not updated for trade " << trade.id << ": " << e.what()
                << "\n";
    }

    result.trades.push_back(trade);

    const Order maker_after = *maker;
    emit(TradeExecutedEvent{trade, stamp(now), event_seq_.next_id()});

    if (!domain::isOpen(maker_after.status)) {
      book.removeResting(maker_after.id);
    }

    // Try both so the store lags by as little as possible. The maker's
    // update is announced only once the store holds it.
    const bool maker_saved = persistOrder(maker_after);
    const bool taker_saved = persistOrder(order);
    if (maker_saved) {
      emit(OrderUpdateEvent{maker_after, maker_previous, stamp(now),
                            event_seq_.next_id()});
    }
    if (!taker_saved) {
      // The store still shows this order as fresh.
      shard->unsaved_takers.insert(order.id);
      taker_stored = false;
    }
    if (!maker_saved || !taker_saved) {
      result.error = ErrorKind::PersistenceFailure;
      result.message = "order update failed after trade " +
                       std::to_string(trade.id);
      break;
    }
  }

  const std::int64_t now = clock_.now_ms();

  // The remainder rests even after a persistence failure: the order exists
  // in the store as open, so it must stay cancellable.
  if (order.remaining().isPositive()) {
    book.addResting(order);
  }

  if (!result.trades.empty()) {
    persistStats(book.stats());
  }

  invalidateCache(order.symbol);
  publishSnapshot(*shard, now);

  if (order.status != taker_initial && taker_stored) {
    emit(OrderUpdateEvent{order, taker_initial, stamp(now),
                          event_seq_.next_id()});
  }

  result.order = std::move(order);
  return result;
}

// -----------------------------------------------------------------------------
// cancelOrder()
// -----------------------------------------------------------------------------
bool MatchingEngine::cancelOrder(domain::OrderId order_id,
                                 domain::UserId requesting_user_id) {
  std::optional<Order> stored;
  try {
    stored = store_.getOrder(order_id);
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] ERROR: cancel of order " << order_id
              << " could not read the store: " << e.what() << "\n";
    return false;
  }

  // Unknown and foreign orders answer the same way.
  if (!stored || stored->user_id != requesting_user_id) {
    return false;
  }

  SymbolShard* shard = findShard(stored->symbol);
  if (shard == nullptr) {
    return false;
  }

  std::lock_guard lock(shard->mutex);

  // The book is authoritative: only a resting order can be cancelled. A
  // terminal order (filled, or cancelled by a racing call) is not in it.
  Order* resting = shard->book.findResting(order_id);
  if (resting == nullptr) {
    return false;
  }

  Order cancelled = *resting;
  const OrderStatus previous = cancelled.status;
  cancelled.status = OrderStatus::Cancelled;

  if (!persistOrder(cancelled)) {
    return false;
  }

  shard->book.removeResting(order_id);

  const std::int64_t now = clock_.now_ms();
  invalidateCache(cancelled.symbol);
  publishSnapshot(*shard, now);
  emit(OrderUpdateEvent{cancelled, previous, stamp(now),
                        event_seq_.next_id()});

  std::cout << "[MatchingEngine] cancelled order " << order_id << " ("
            << cancelled.symbol << ")\n";
  return true;
}

// -----------------------------------------------------------------------------
// getOrderBook(): cache, then published snapshot
// -----------------------------------------------------------------------------
std::optional<domain::OrderBookSnapshot> MatchingEngine::getOrderBook(
    const std::string& symbol) {
  SymbolShard* shard = findShard(symbol);
  if (shard == nullptr) {
    return std::nullopt;
  }

  const std::string key = bookCacheKey(symbol);
  if (auto cached = readCachedBook(key)) {
    return cached;
  }

  std::shared_ptr<const domain::OrderBookSnapshot> snapshot;
  {
    std::lock_guard lock(shard->published_mutex);
    snapshot = shard->published;
  }

  try {
    cache_.set(key, nlohmann::json(*snapshot).dump(), cache_ttl_ms_);
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] WARNING: cache set failed for " << key
              << ": " << e.what() << "\n";
  }

  return *snapshot;
}

std::optional<domain::OrderBookSnapshot> MatchingEngine::readCachedBook(
    const std::string& key) {
  std::optional<std::string> cached;
  try {
    cached = cache_.get(key);
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] WARNING: cache get failed for " << key
              << ": " << e.what() << "\n";
    return std::nullopt;
  }
  if (!cached) {
    return std::nullopt;
  }

  try {
    return nlohmann::json::parse(*cached).get<domain::OrderBookSnapshot>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MatchingEngine] WARNING: dropping corrupt cache entry "
              << key << ": " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[MatchingEngine] WARNING: dropping corrupt cache entry "
              << key << ": " << e.what() << "\n";
  }

  try {
    cache_.erase(key);
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] WARNING: cache erase failed for " << key
              << ": " << e.what() << "\n";
  }
  return std::nullopt;
}

std::shared_ptr<const domain::OrderBookSnapshot>
MatchingEngine::publishedSnapshot(const std::string& symbol) const {
  SymbolShard* shard = findShard(symbol);
  if (shard == nullptr) {
    return nullptr;
  }
  std::lock_guard lock(shard->published_mutex);
  return shard->published;
}

// -----------------------------------------------------------------------------
// recover(): resting sets and aggregates from the store
// -----------------------------------------------------------------------------
std::size_t MatchingEngine::recover() {
  OrderFilter filter;
  filter.statuses = {OrderStatus::Pending, OrderStatus::PartiallyFilled};
  std::vector<Order> open_orders = store_.findOrders(filter);

  // Oldest first, the order they originally joined the book in.
  std::sort(open_orders.begin(), open_orders.end(),
            [](const Order& a, const Order& b) {
              if (a.created_at_ms != b.created_at_ms) {
                return a.created_at_ms < b.created_at_ms;
              }
              return a.id < b.id;
            });

  std::size_t restored = 0;
  for (const auto& order : open_orders) {
    SymbolShard* shard = findShard(order.symbol);
    if (shard == nullptr) {
      std::cerr << "[MatchingEngine] WARNING: recovery skips order "
                << order.id << ": symbol '" << order.symbol
                << "' is not listed\n";
      continue;
    }

    std::lock_guard lock(shard->mutex);
    try {
      shard->book.addResting(order);
      ++restored;
    } catch (const std::invalid_argument& e) {
      std::cerr << "[MatchingEngine] WARNING: recovery skips order "
                << order.id << ": " << e.what() << "\n";
    }
  }

  const std::int64_t now = clock_.now_ms();
  for (const auto& symbol : listedSymbols()) {
    SymbolShard* shard = findShard(symbol);
    std::lock_guard lock(shard->mutex);
    if (auto stats = store_.loadBookStats(symbol)) {
      shard->book.restoreStats(*stats);
    }
    invalidateCache(symbol);
    publishSnapshot(*shard, now);
  }

  std::cout << "[MatchingEngine] recovery complete: " << restored
            << " resting order(s) restored.\n";
  return restored;
}

// -----------------------------------------------------------------------------
// resetRollingStats()
// -----------------------------------------------------------------------------
bool MatchingEngine::resetRollingStats(const std::string& symbol) {
  SymbolShard* shard = findShard(symbol);
  if (shard == nullptr) {
    return false;
  }

  std::lock_guard lock(shard->mutex);
  const std::int64_t now = clock_.now_ms();
  shard->book.resetRollingStats(now);
  persistStats(shard->book.stats());
  invalidateCache(symbol);
  publishSnapshot(*shard, now);
  return true;
}

// -----------------------------------------------------------------------------
// Store-backed queries
// -----------------------------------------------------------------------------
std::optional<Order> MatchingEngine::getOrder(domain::OrderId id) const {
  return store_.getOrder(id);
}

std::vector<Order> MatchingEngine::ordersForUser(
    domain::UserId user_id, std::optional<OrderStatus> status,
    std::optional<std::size_t> limit) const {
  OrderFilter filter;
  filter.user_id = user_id;
  if (status) {
    filter.statuses.push_back(*status);
  }
  filter.limit = limit;
  return store_.findOrders(filter);
}

std::vector<Trade> MatchingEngine::tradesForUser(
    domain::UserId user_id, std::optional<std::string> symbol,
    std::optional<std::size_t> limit) const {
  TradeFilter filter;
  filter.user_id = user_id;
  filter.symbol = std::move(symbol);
  filter.limit = limit;
  return store_.findTrades(filter);
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
bool MatchingEngine::persistOrder(const Order& order) {
  try {
    store_.updateOrder(order);
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] ERROR: updateOrder failed for order "
              << order.id << " (" << domain::toString(order.status)
              << ", filled " << order.filled_amount << "): " << e.what()
              << "\n";
    return false;
  }
}

bool MatchingEngine::persistStats(const domain::BookStats& stats) {
  try {
    store_.saveBookStats(stats);
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] ERROR: saveBookStats failed for "
              << stats.symbol << ": " << e.what() << "\n";
    return false;
  }
}

void MatchingEngine::publishSnapshot(SymbolShard& shard, std::int64_t now_ms) {
  auto snapshot =
      std::make_shared<const domain::OrderBookSnapshot>(shard.book.snapshot());
  {
    std::lock_guard lock(shard.published_mutex);
    shard.published = snapshot;
  }
  emit(OrderBookUpdatedEvent{std::move(snapshot), stamp(now_ms),
                             event_seq_.next_id()});
}

void MatchingEngine::invalidateCache(const std::string& symbol) {
  try {
    cache_.erase(bookCacheKey(symbol));
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] WARNING: cache erase failed for "
              << symbol << ": " << e.what() << "\n";
  }
}

void MatchingEngine::emit(Event event) {
  if (!sink_) {
    return;
  }
  try {
    sink_(std::move(event));
  } catch (const std::exception& e) {
    std::cerr << "[MatchingEngine] ERROR: event sink failed: " << e.what()
              << "\n";
  }
}

Timestamp MatchingEngine::stamp(std::int64_t now_ms) const {
  return ms_to_timestamp(now_ms);
}

}  // namespace matchcore
