#include "pulse/notify/notification_bus.hpp"

#include <algorithm>

namespace pulse {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
NotificationBus::SubscriptionId NotificationBus::subscribe(
    GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void NotificationBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(notification)
// -----------------------------------------------------------------------------
void NotificationBus::publish(const Notification& notification) {
  std::vector<SubscriberEntry> copy;

  {
    // Copy under the lock, call outside it. A subscriber added concurrently
    // may miss this notification.
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  for (const auto& [id, callback] : copy) {
    callback(notification);
  }
}

std::size_t NotificationBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace pulse
