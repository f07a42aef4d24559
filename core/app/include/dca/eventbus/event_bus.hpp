#pragma once

#include "dca/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace dca {

// -----------------------------------------------------------------------------
// EventBus — synchronous publish/subscribe for lifecycle notifications
// -----------------------------------------------------------------------------
//
// @brief  Subscribers register callbacks; DcaEngine publishes Event values;
//         every matching callback runs on the publishing thread before
//         publish() returns.
//
// @details
// Subscribers today: the IpcServer telemetry bridge, the executable's
// console logger, and tests.
//
// Thread model:
//   subscribe/unsubscribe/publish are safe from any thread. The subscriber
//   list is copied under the lock and callbacks run without it, so a
//   callback may itself publish, subscribe, unsubscribe, or call back into
//   DcaEngine (which publishes only after releasing its own lock).
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every event type.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored. A publish() already in flight on another
  // thread may still deliver one more event to the removed callback.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  // Publishes in order. Used by DcaEngine to flush an operation's outbox.
  void publishAll(const std::vector<Event>& events);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Typed subscribe: filter the variant with std::get_if
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

}  // namespace dca
