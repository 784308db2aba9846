#pragma once

#include "matchcore/concurrent/id_generator.hpp"
#include "matchcore/store/i_order_store.hpp"
#include "matchcore/store/in_memory_order_store.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace matchcore {

// -----------------------------------------------------------------------------
// JournalOrderStore: append-only JSON-lines persistence
// -----------------------------------------------------------------------------
//
// @brief  Durable IOrderStore. Every mutation is one JSON line appended to a
//         journal file; the full state is rebuilt by replaying the file.
//
// @details
// Record format (one per line, encoded with the json_codec overloads):
//
//   {"kind": "order",      "data": {...Order...}}
//   {"kind": "trade",      "data": {...Trade...}}
//   {"kind": "book_stats", "data": {...BookStats...}}
//
// An order record is written on create and on every update; replay keeps
// the last one per id. Decimals are strings, so nothing is rounded.
//
// Write path (createOrder, updateOrder, createTrade, saveBookStats):
//   1. assign an id if the call creates a record,
//   2. append the line and flush; failure throws StoreError and nothing is
//      applied,
//   3. apply the record to the in-memory state.
// Writes are serialized by write_mutex_, so lines hit the file in the same
// order their effects become visible to readers.
//
// Open/replay:
//   The constructor replays an existing file line by line. Malformed lines
//   (bad JSON, unknown kind, invalid record) are logged and skipped, so a
//   torn final line after a crash does not prevent start-up. Id generators
//   resume past the largest id seen. A file that cannot be opened for
//   appending throws StoreError.
//
// Torn tail:
//   If the file ends in a partial line (a crash mid-write in an earlier run,
//   or a failed append in this process), the next append first writes a
//   newline, so the new record is never glued onto the broken one.
//
// Thread model:
//   Writes serialize on write_mutex_; reads go straight to the in-memory
//   state, which has its own mutex. Safe from any thread.
// -----------------------------------------------------------------------------
class JournalOrderStore final : public IOrderStore {
 public:
  // Replays `path` if it exists, then opens it for appending.
  // @throws StoreError if the journal cannot be opened.
  explicit JournalOrderStore(std::string path);

  JournalOrderStore(const JournalOrderStore&) = delete;
  JournalOrderStore& operator=(const JournalOrderStore&) = delete;

  domain::Order createOrder(domain::Order order) override;
  void updateOrder(const domain::Order& order) override;
  std::optional<domain::Order> getOrder(domain::OrderId id) const override;

  domain::Trade createTrade(domain::Trade trade) override;

  std::vector<domain::Order> findOrders(
      const OrderFilter& filter) const override;
  std::vector<domain::Trade> findTrades(
      const TradeFilter& filter) const override;

  void saveBookStats(const domain::BookStats& stats) override;
  std::optional<domain::BookStats> loadBookStats(
      const std::string& symbol) const override;

  const std::string& path() const { return path_; }

  // Lines applied during replay / skipped as malformed.
  std::size_t replayedRecords() const { return replayed_; }
  std::size_t skippedRecords() const { return skipped_; }

 private:
  void replay();
  void applyRecord(const nlohmann::json& record);

  // Appends one record and flushes. Caller holds write_mutex_.
  void append(const char* kind, const nlohmann::json& data);

  std::string path_;
  InMemoryOrderStore state_;
  IdGenerator order_ids_;
  IdGenerator trade_ids_;

  std::mutex write_mutex_;
  std::ofstream out_;
  bool torn_tail_{false};  // Last line in the file lacks its newline

  std::size_t replayed_{0};
  std::size_t skipped_{0};
};

}  // namespace matchcore
