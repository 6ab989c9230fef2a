#pragma once

#include "paper/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace paper {

// -----------------------------------------------------------------------------
// EventBus - in-process telemetry fan-out
// -----------------------------------------------------------------------------
//
// @brief  Publish/subscribe channel for the Event variant. The Simulator
//         publishes position, capital, alert and rejection events; the
//         IpcServer and tests subscribe.
//
// @details
// Callbacks run synchronously on the publishing thread. A callback that
// throws std::exception is logged and skipped so telemetry can never abort
// a committed lifecycle step.
//
// Thread model:
//   subscribe(), unsubscribe() and publish() are safe from any thread.
//   publish() copies the subscriber list under mutex_ and invokes the
//   callbacks without it, so a callback may publish or unsubscribe.
//   A callback removed during a publish may still see that one event.
//
// Ownership:
//   Owned by PaperEngine (or a test) and injected by reference.
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

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
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

}  // namespace paper
