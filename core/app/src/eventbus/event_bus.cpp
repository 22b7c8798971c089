#include "gridmm/eventbus/event_bus.hpp"

#include <algorithm>

namespace gridmm {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// Unknown ids are ignored; components unsubscribe unconditionally in their
// destructors.
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(
      subscribers_.begin(), subscribers_.end(),
      [id](const SubscriberEntry& e) { return e.first == id; });
  if (it != subscribers_.end()) {
    subscribers_.erase(it);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

// -----------------------------------------------------------------------------
// publish(): snapshot the subscriber list, then dispatch without the lock
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;
  {
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  for (const auto& entry : copy) {
    entry.second(event);
  }
}

}  // namespace gridmm
