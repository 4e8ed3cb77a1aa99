#pragma once

#include "pulse/notify/notification.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace pulse {

// -----------------------------------------------------------------------------
// NotificationBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel between the engines and the
// application. Listeners register callbacks; engine effect handlers publish
// Notification values.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe and
// publish. Callbacks run synchronously on the publishing thread, which is
// the lane of the engine that produced the notification. A slow listener
// therefore delays that engine; hand heavy work off to another thread.
// -----------------------------------------------------------------------------
class NotificationBus {
 public:
  using GenericCallback = std::function<void(const Notification&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  NotificationBus() = default;

  NotificationBus(const NotificationBus&) = delete;
  NotificationBus& operator=(const NotificationBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked for every published notification.
  // Returns the SubscriptionId to use with unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<T>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the notification holds a T
  // (domain::Status, domain::Message or domain::HeartbeatStatus).
  // -------------------------------------------------------------------------
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // Removes the subscription. If publish() is in progress on another thread
  // the callback may still run for that notification, never for later ones.
  // Unknown ids are ignored.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(notification)
  // -------------------------------------------------------------------------
  // Invokes every registered callback before returning. The subscriber list
  // is copied under the lock and callbacks run without it, so a callback may
  // publish or unsubscribe without deadlocking.
  // -------------------------------------------------------------------------
  void publish(const Notification& notification);

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
template <typename T>
NotificationBus::SubscriptionId NotificationBus::subscribe(
    std::function<void(const T&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](
                                const Notification& notification) {
    if (const auto* ptr = std::get_if<T>(&notification)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace pulse
