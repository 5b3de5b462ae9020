#pragma once

#include "capital/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace capital {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish/subscribe channel for the Event variant.
//
// @details
// The AllocationEngine publishes proposals, blocks, capital transactions and
// kill-switch trips here; the IPC server and tests subscribe. Inbound
// collaborator events are dispatched through the allocation loop's bus.
//
// Callbacks run on the publishing thread, before publish() returns. The
// subscriber list is copied under the lock and invoked without it, so a
// callback may publish or unsubscribe without deadlocking.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback for one alternative of the Event variant only.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish already in flight may still call it
  // once more.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// Typed subscribe: wraps the callback in a generic one that filters on the
// variant's active alternative.
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

}  // namespace capital
