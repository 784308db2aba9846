#include "matchcore/codec/json_codec.hpp"
#include "matchcore/time/time_utils.hpp"

#include <stdexcept>
#include <string>

namespace matchcore {
namespace domain {

namespace {

nlohmann::json optionalDecimal(const std::optional<Decimal>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<Decimal> readOptionalDecimal(const nlohmann::json& j,
                                           const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<Decimal>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Decimal
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Decimal& value) {
  j = value.toString();
}

void from_json(const nlohmann::json& j, Decimal& value) {
  // get<std::string>() throws type_error for non-strings, numbers included.
  value = Decimal::parse(j.get<std::string>());
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Order& order) {
  j = nlohmann::json{
      {"id", order.id},
      {"user_id", order.user_id},
      {"symbol", order.symbol},
      {"side", toString(order.side)},
      {"price", order.price},
      {"amount", order.amount},
      {"filled_amount", order.filled_amount},
      {"status", toString(order.status)},
      {"created_at_ms", order.created_at_ms},
  };
}

void from_json(const nlohmann::json& j, Order& order) {
  order.id = j.at("id").get<OrderId>();
  order.user_id = j.at("user_id").get<UserId>();
  order.symbol = j.at("symbol").get<std::string>();

  const auto side_text = j.at("side").get<std::string>();
  auto side = parseSide(side_text);
  if (!side) {
    throw std::invalid_argument("unknown side '" + side_text + "'");
  }
  order.side = *side;

  order.price = j.at("price").get<Decimal>();
  order.amount = j.at("amount").get<Decimal>();
  order.filled_amount = j.at("filled_amount").get<Decimal>();

  const auto status_text = j.at("status").get<std::string>();
  auto status = parseOrderStatus(status_text);
  if (!status) {
    throw std::invalid_argument("unknown order status '" + status_text + "'");
  }
  order.status = *status;

  order.created_at_ms = j.at("created_at_ms").get<std::int64_t>();
}

// -----------------------------------------------------------------------------
// Trade
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Trade& trade) {
  j = nlohmann::json{
      {"id", trade.id},
      {"symbol", trade.symbol},
      {"price", trade.price},
      {"amount", trade.amount},
      {"buyer_user_id", trade.buyer_user_id},
      {"seller_user_id", trade.seller_user_id},
      {"buy_order_id", trade.buy_order_id},
      {"sell_order_id", trade.sell_order_id},
      {"taker_side", toString(trade.taker_side)},
      {"created_at_ms", trade.created_at_ms},
  };
}

void from_json(const nlohmann::json& j, Trade& trade) {
  trade.id = j.at("id").get<TradeId>();
  trade.symbol = j.at("symbol").get<std::string>();
  trade.price = j.at("price").get<Decimal>();
  trade.amount = j.at("amount").get<Decimal>();
  trade.buyer_user_id = j.at("buyer_user_id").get<UserId>();
  trade.seller_user_id = j.at("seller_user_id").get<UserId>();
  trade.buy_order_id = j.at("buy_order_id").get<OrderId>();
  trade.sell_order_id = j.at("sell_order_id").get<OrderId>();

  const auto side_text = j.at("taker_side").get<std::string>();
  auto side = parseSide(side_text);
  if (!side) {
    throw std::invalid_argument("unknown taker side '" + side_text + "'");
  }
  trade.taker_side = *side;

  trade.created_at_ms = j.at("created_at_ms").get<std::int64_t>();
}

// -----------------------------------------------------------------------------
// BookStats
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const BookStats& stats) {
  j = nlohmann::json{
      {"symbol", stats.symbol},
      {"last_price", optionalDecimal(stats.last_price)},
      {"volume_24h", stats.volume_24h},
      {"high_24h", optionalDecimal(stats.high_24h)},
      {"low_24h", optionalDecimal(stats.low_24h)},
      {"updated_at_ms", stats.updated_at_ms},
  };
}

void from_json(const nlohmann::json& j, BookStats& stats) {
  stats.symbol = j.at("symbol").get<std::string>();
  stats.last_price = readOptionalDecimal(j, "last_price");
  stats.volume_24h = j.at("volume_24h").get<Decimal>();
  stats.high_24h = readOptionalDecimal(j, "high_24h");
  stats.low_24h = readOptionalDecimal(j, "low_24h");
  stats.updated_at_ms = j.at("updated_at_ms").get<std::int64_t>();
}

// -----------------------------------------------------------------------------
// BookEntry / OrderBookSnapshot
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const BookEntry& entry) {
  j = nlohmann::json{
      {"order_id", entry.order_id},
      {"price", entry.price},
      {"remaining", entry.remaining},
      {"created_at_ms", entry.created_at_ms},
  };
}

void from_json(const nlohmann::json& j, BookEntry& entry) {
  entry.order_id = j.at("order_id").get<OrderId>();
  entry.price = j.at("price").get<Decimal>();
  entry.remaining = j.at("remaining").get<Decimal>();
  entry.created_at_ms = j.at("created_at_ms").get<std::int64_t>();
}

void to_json(nlohmann::json& j, const OrderBookSnapshot& snapshot) {
  j = nlohmann::json(snapshot.stats);
  j["bids"] = snapshot.bids;
  j["asks"] = snapshot.asks;
}

void from_json(const nlohmann::json& j, OrderBookSnapshot& snapshot) {
  snapshot.stats = j.get<BookStats>();
  snapshot.bids = j.at("bids").get<std::vector<BookEntry>>();
  snapshot.asks = j.at("asks").get<std::vector<BookEntry>>();
}

}  // namespace domain

// -----------------------------------------------------------------------------
// eventToJson(): one envelope per variant alternative
// -----------------------------------------------------------------------------
nlohmann::json eventToJson(const Event& event) {
  nlohmann::json j;

  if (const auto* e = std::get_if<TradeExecutedEvent>(&event)) {
    j["type"] = "trade_executed";
    j["sequence_id"] = e->sequence_id;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["data"] = e->trade;
  } else if (const auto* e = std::get_if<OrderBookUpdatedEvent>(&event)) {
    j["type"] = "order_book_updated";
    j["sequence_id"] = e->sequence_id;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["data"] = e->snapshot ? nlohmann::json(*e->snapshot)
                            : nlohmann::json(nullptr);
  } else if (const auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    j["type"] = "order_update";
    j["sequence_id"] = e->sequence_id;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["previous_status"] = domain::toString(e->previous_status);
    j["data"] = e->order;
  }

  return j;
}

}  // namespace matchcore
