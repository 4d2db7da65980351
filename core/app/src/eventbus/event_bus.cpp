#include "relay/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace relay {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(
      subscribers_.begin(), subscribers_.end(),
      [id](const SubscriberEntry& entry) { return entry.first == id; });
  if (it != subscribers_.end()) {
    subscribers_.erase(it);
  }
}

// -----------------------------------------------------------------------------
// publish(notification)
// -----------------------------------------------------------------------------
// Subscribers added while this call is running first see the next
// notification. A subscriber that throws is reported and skipped; the
// transport subscriber must still receive the broadcast when a logging
// subscriber fails.
// -----------------------------------------------------------------------------
std::size_t EventBus::publish(const Notification& notification) {
  std::vector<SubscriberEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  std::size_t delivered = 0;
  for (const auto& [id, callback] : snapshot) {
    try {
      callback(notification);
      ++delivered;
    } catch (const std::exception& e) {
      failed_deliveries_.fetch_add(1);
      std::cerr << "[EventBus] subscriber " << id
                << " failed on notification #" << notification.index() << ": "
                << e.what() << std::endl;
    }
  }
  return delivered;
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace relay
