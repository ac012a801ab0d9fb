#pragma once

#include "ledger/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe channel for ledger
// notifications. The notification EventLoopThread owns one bus and is its
// only publisher in the engine; LowStockMonitor and the IPC telemetry
// bridge subscribe to it.
//
// Thread model: subscribe, unsubscribe and publish are safe from any
// thread. Callbacks run synchronously on the publishing thread. The
// subscriber list is copied under the lock and the callbacks run without
// it, so a callback may itself publish (LowStockMonitor does) or
// unsubscribe.
//
// A callback that throws is logged to std::cerr and does not prevent the
// remaining subscribers from seeing the event.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every event.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Receives only events holding EventType, already unwrapped.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // After this returns the callback is not invoked for later publishes. A
  // publish already in flight on another thread may still call it once.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Guards subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

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

}  // namespace ledger
