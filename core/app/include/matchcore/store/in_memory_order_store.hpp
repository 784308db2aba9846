#pragma once

#include "matchcore/concurrent/id_generator.hpp"
#include "matchcore/store/i_order_store.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace matchcore {

// -----------------------------------------------------------------------------
// InMemoryOrderStore
// -----------------------------------------------------------------------------
//
// @brief  IOrderStore backed by mutex-guarded maps. Default store of the
//         engine and the state holder behind JournalOrderStore.
//
// @details
// Orders and trades are kept in std::map keyed by id. Ids come from two
// IdGenerators, so they are unique and increasing even though the maps are
// only touched under mutex_.
//
// restore*() upsert a record with its existing id and move the matching
// generator past it. JournalOrderStore uses them to apply replayed and
// freshly journaled records; tests use them to seed state.
//
// Thread model:
//   Every method takes mutex_; safe from any thread. Queries copy results
//   out, so callers never hold references into the store.
// -----------------------------------------------------------------------------
class InMemoryOrderStore final : public IOrderStore {
 public:
  InMemoryOrderStore() = default;

  InMemoryOrderStore(const InMemoryOrderStore&) = delete;
  InMemoryOrderStore& operator=(const InMemoryOrderStore&) = delete;

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

  // Upserts with the record's own id (id must be > 0).
  void restoreOrder(const domain::Order& order);
  void restoreTrade(const domain::Trade& trade);

  std::size_t orderCount() const;
  std::size_t tradeCount() const;

 private:
  mutable std::mutex mutex_;
  std::map<domain::OrderId, domain::Order> orders_;
  std::map<domain::TradeId, domain::Trade> trades_;
  std::unordered_map<std::string, domain::BookStats> book_stats_;
  IdGenerator order_ids_;
  IdGenerator trade_ids_;
};

}  // namespace matchcore
