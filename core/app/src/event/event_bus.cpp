#include "matchcore/eventbus/event_bus.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace matchcore {

namespace {

const char* eventKindName(const Event& event) {
  if (std::holds_alternative<TradeExecutedEvent>(event)) {
    return "trade_executed";
  }
  if (std::holds_alternative<OrderBookUpdatedEvent>(event)) {
    return "order_book_updated";
  }
  return "order_update";
}

}  // namespace

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;

  {
    // Copy under the lock, invoke without it: callbacks may re-enter the bus.
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  for (const auto& [id, callback] : copy) {
    // One failing subscriber must not starve the rest.
    try {
      callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] ERROR: subscriber " << id << " failed on "
                << eventKindName(event) << ": " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// subscriberCount()
// -----------------------------------------------------------------------------
std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace matchcore
