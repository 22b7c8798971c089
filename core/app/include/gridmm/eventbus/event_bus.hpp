#pragma once

#include "gridmm/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace gridmm {

// -----------------------------------------------------------------------------
// EventBus — typed publish/subscribe over the Event variant
// -----------------------------------------------------------------------------
//
// @brief  Synchronous fan-out: publish() invokes every subscriber on the
//         calling thread, in subscription order.
//
// @details
// Components subscribe in their constructor and unsubscribe in their
// destructor. The typed subscribe<T>() wraps a callback so it only fires for
// events holding T.
//
// publish() copies the subscriber list under the lock and invokes callbacks
// without it, so a callback may publish again (re-entrant dispatch) or
// subscribe/unsubscribe without deadlocking. Events published from inside a
// callback are delivered depth-first, before publish() returns.
//
// Thread model:
//   subscribe/unsubscribe/publish are safe from any thread. In the agent
//   each bus is only published on by the thread that owns it.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  // Number of live subscriptions; components that unsubscribe in their
  // destructor leave it where they found it.
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

}  // namespace gridmm
