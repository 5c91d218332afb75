#pragma once

#include "tradeguard/events/event.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe for the core's Event variant.
// The core loop publishes each dequeued venue event; ExecutionDispatcher
// publishes OrderUpdateEvent after tracker transitions; RiskManager's
// kill-switch listener publishes KillSwitchEvent. Subscribers include the
// dispatcher itself, the IPC telemetry bridge and tests.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread. The subscriber list
// is copy-on-write: publish() takes a reference to the current list under
// the lock and runs the callbacks without it, so a callback may publish or
// unsubscribe without deadlocking, and publishing never copies the list.
//
// Names are for diagnostics only; they need not be unique.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Every published event. Returns the id to pass to unsubscribe().
  SubscriptionId subscribe(GenericCallback callback, std::string name = {});

  // Only events whose variant holds EventType (e.g. FillEvent).
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback,
                           std::string name = {});

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // Returns false if id is unknown. A publish() already in progress on
  // another thread may still invoke the callback once.
  // -------------------------------------------------------------------------
  bool unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every subscriber, in subscription order, before returning.
  // A callback that throws is logged with its name and the remaining
  // subscribers still run; the first exception is then rethrown to the
  // publisher.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  struct Subscriber {
    SubscriptionId id;
    std::string name;
    GenericCallback callback;
  };
  using SubscriberList = std::vector<Subscriber>;

  mutable std::mutex mutex_;   // Protects subscribers_ and next_id_
  SubscriptionId next_id_{1};
  std::shared_ptr<const SubscriberList> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback, std::string name) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped), std::move(name));
}

}  // namespace tradeguard
