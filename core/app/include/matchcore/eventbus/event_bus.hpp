#pragma once

#include "matchcore/events/event.hpp"
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace matchcore {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for engine events. Subscribers
// register callbacks; publish() invokes each of them with the event.
//
// Delivery contract (fire-and-forget):
//   A subscriber that throws is logged and skipped. Every other subscriber
//   still receives the event, and publish() itself never throws because of a
//   subscriber. The publisher therefore cannot be failed by a consumer.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the thread that calls publish(); in the
// engine that is the notification EventLoopThread, not a matching thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Callback for "all events". Use std::visit or std::get_if inside.
  using GenericCallback = std::function<void(const Event&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published event.
  // Thread-safety: Safe from any thread; mutex protects the subscriber list.
  // Output: SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the event holds EventType
  // (e.g. TradeExecutedEvent). Implemented by wrapping in a generic callback
  // that checks the variant alternative.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // What: Removes the subscription. A publish() already in progress may
  // still run the callback for its current event. Unknown ids are ignored.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Delivers the event to all current subscribers, in subscription
  // order, before returning.
  // Thread-safety: The subscriber list is copied under the lock and the
  // callbacks run without it, so a callback may publish() or unsubscribe()
  // without deadlocking.
  // Errors: std::exception from a callback is caught per subscriber and
  // logged to std::cerr.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Number of live subscriptions (snapshot).
  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace matchcore
