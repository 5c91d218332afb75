#include "tradeguard/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace tradeguard {

EventBus::EventBus() : subscribers_(std::make_shared<SubscriberList>()) {}

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback,
                                             std::string name) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  auto next = std::make_shared<SubscriberList>(*subscribers_);
  next->push_back({id, std::move(name), std::move(callback)});
  subscribers_ = std::move(next);
  return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(subscribers_->begin(), subscribers_->end(),
                         [id](const Subscriber& s) { return s.id == id; });
  if (it == subscribers_->end()) {
    return false;
  }
  auto next = std::make_shared<SubscriberList>();
  next->reserve(subscribers_->size() - 1);
  for (const auto& s : *subscribers_) {
    if (s.id != id) {
      next->push_back(s);
    }
  }
  subscribers_ = std::move(next);
  return true;
}

// -----------------------------------------------------------------------------
// publish(): the list pointer is taken under the lock, callbacks run unlocked
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::shared_ptr<const SubscriberList> current;
  {
    std::lock_guard lock(mutex_);
    current = subscribers_;
  }

  std::exception_ptr first_failure;
  for (const auto& s : *current) {
    try {
      s.callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] subscriber #" << s.id
                << (s.name.empty() ? "" : " (" + s.name + ")")
                << " threw: " << e.what() << "\n";
      if (!first_failure) {
        first_failure = std::current_exception();
      }
    }
  }
  if (first_failure) {
    std::rethrow_exception(first_failure);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_->size();
}

}  // namespace tradeguard
