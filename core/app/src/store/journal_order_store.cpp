#include "matchcore/store/journal_order_store.hpp"
#include "matchcore/codec/json_codec.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace matchcore {

using domain::Order;
using domain::Trade;

// -----------------------------------------------------------------------------
// Constructor: replay, then open for append
// -----------------------------------------------------------------------------
JournalOrderStore::JournalOrderStore(std::string path)
    : path_(std::move(path)) {
  replay();

  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_.is_open()) {
    throw StoreError("cannot open journal '" + path_ + "' for writing");
  }

  std::cout << "[JournalOrderStore] opened " << path_ << ": " << replayed_
            << " record(s) replayed, " << skipped_ << " skipped.\n";
}

// -----------------------------------------------------------------------------
// replay(): rebuild state from an existing journal
// -----------------------------------------------------------------------------
void JournalOrderStore::replay() {
  std::ifstream in(path_);
  if (!in.is_open()) {
    // No journal yet: fresh store.
    return;
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    // getline hits EOF only on a final line with no terminating newline.
    torn_tail_ = in.eof();
    if (line.empty()) {
      continue;
    }

    try {
      applyRecord(nlohmann::json::parse(line));
      ++replayed_;
    } catch (const nlohmann::json::exception& e) {
      ++skipped_;
      std::cerr << "[JournalOrderStore] WARNING: skipping line " << line_no
                << " of " << path_ << ": " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
      ++skipped_;
      std::cerr << "[JournalOrderStore] WARNING: skipping line " << line_no
                << " of " << path_ << ": " << e.what() << "\n";
    }
  }

  if (in.bad()) {
    throw StoreError("read error while replaying journal '" + path_ + "'");
  }
}

// -----------------------------------------------------------------------------
// applyRecord(): one replayed line into the in-memory state
// -----------------------------------------------------------------------------
void JournalOrderStore::applyRecord(const nlohmann::json& record) {
  const auto kind = record.at("kind").get<std::string>();
  const auto& data = record.at("data");

  if (kind == "order") {
    auto order = data.get<Order>();
    if (order.id == 0) {
      throw std::invalid_argument("order record with id 0");
    }
    state_.restoreOrder(order);
    order_ids_.advancePast(order.id);
  } else if (kind == "trade") {
    auto trade = data.get<Trade>();
    if (trade.id == 0) {
      throw std::invalid_argument("trade record with id 0");
    }
    state_.restoreTrade(trade);
    trade_ids_.advancePast(trade.id);
  } else if (kind == "book_stats") {
    state_.saveBookStats(data.get<domain::BookStats>());
  } else {
    throw std::invalid_argument("unknown record kind '" + kind + "'");
  }
}

// -----------------------------------------------------------------------------
// append(): write-ahead of every mutation
// -----------------------------------------------------------------------------
void JournalOrderStore::append(const char* kind, const nlohmann::json& data) {
  const nlohmann::json record{{"kind", kind}, {"data", data}};
  if (torn_tail_) {
    // Terminate the partial line so this record starts on its own.
    out_ << '\n';
  }
  out_ << record.dump() << '\n';
  out_.flush();

  if (!out_) {
    // Clear so a later call can retry once the underlying problem is gone.
    out_.clear();
    torn_tail_ = true;
    throw StoreError(std::string("failed to append ") + kind +
                     " record to journal '" + path_ + "'");
  }
  torn_tail_ = false;
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
Order JournalOrderStore::createOrder(Order order) {
  std::lock_guard lock(write_mutex_);
  order.id = order_ids_.next_id();
  append("order", order);
  state_.restoreOrder(order);
  return order;
}

void JournalOrderStore::updateOrder(const Order& order) {
  std::lock_guard lock(write_mutex_);
  if (!state_.getOrder(order.id)) {
    throw StoreError("updateOrder: unknown order id " +
                     std::to_string(order.id));
  }
  append("order", order);
  state_.restoreOrder(order);
}

std::optional<Order> JournalOrderStore::getOrder(domain::OrderId id) const {
  return state_.getOrder(id);
}

// -----------------------------------------------------------------------------
// Trades
// -----------------------------------------------------------------------------
Trade JournalOrderStore::createTrade(Trade trade) {
  std::lock_guard lock(write_mutex_);
  trade.id = trade_ids_.next_id();
  append("trade", trade);
  state_.restoreTrade(trade);
  return trade;
}

// -----------------------------------------------------------------------------
// Queries and aggregates
// -----------------------------------------------------------------------------
std::vector<Order> JournalOrderStore::findOrders(
    const OrderFilter& filter) const {
  return state_.findOrders(filter);
}

std::vector<Trade> JournalOrderStore::findTrades(
    const TradeFilter& filter) const {
  return state_.findTrades(filter);
}

void JournalOrderStore::saveBookStats(const domain::BookStats& stats) {
  std::lock_guard lock(write_mutex_);
  append("book_stats", stats);
  state_.saveBookStats(stats);
}

std::optional<domain::BookStats> JournalOrderStore::loadBookStats(
    const std::string& symbol) const {
  return state_.loadBookStats(symbol);
}

}  // namespace matchcore
