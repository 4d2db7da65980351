#pragma once

#include "relay/events/notification.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish-subscribe channel for Notification
// values. The broker core publishes; the IPC server, the executable's
// logging and tests subscribe.
//
// This is NOT the room broadcast mechanism. Rooms and their buffers are
// state in the store; the bus only announces that something happened
// (e.g. "event 42 was appended to room lobby, deliver it to c1 and c2").
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread (the request loop).
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Notification&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published notification.
  // Output: SubscriptionId to use with unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<NotificationType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the published notification
  // holds a NotificationType (e.g. EventBroadcast).
  // -------------------------------------------------------------------------
  template <typename NotificationType>
  SubscriptionId subscribe(
      std::function<void(const NotificationType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // What: Removes the subscription. Unknown ids are ignored. A publish()
  // already in progress on another thread may still invoke the callback once.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(notification)
  // -------------------------------------------------------------------------
  // What: Invokes every current subscriber before returning. The subscriber
  // list is copied under the lock and callbacks run unlocked, so a callback
  // may publish or unsubscribe without deadlocking.
  // Output: Number of subscribers that returned normally. A subscriber that
  // throws std::exception is logged and counted in failedDeliveries(); the
  // remaining subscribers still run.
  // -------------------------------------------------------------------------
  std::size_t publish(const Notification& notification);

  std::size_t subscriberCount() const;
  std::uint64_t failedDeliveries() const { return failed_deliveries_.load(); }

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
  std::atomic<std::uint64_t> failed_deliveries_{0};
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
// Wraps the typed callback in a generic one that filters with std::get_if.
// -----------------------------------------------------------------------------
template <typename NotificationType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const NotificationType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](
                                const Notification& notification) {
    if (const auto* ptr = std::get_if<NotificationType>(&notification)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace relay
