#include "relay/rooms/cleanup_sweep.hpp"

#include "relay/time/time_utils.hpp"

#include <iostream>

namespace relay {

CleanupSweep::CleanupSweep(IStateStore& store, RoomRegistry& registry,
                           const ITimeProvider& time_provider, EventBus& bus,
                           const domain::BrokerConfig& config)
    : store_(store),
      registry_(registry),
      time_provider_(time_provider),
      bus_(bus),
      connection_timeout_ms_(config.connection_timeout_ms),
      max_event_age_ms_(config.max_event_age_ms) {}

// -----------------------------------------------------------------------------
// run: connections first so emptied rooms are visible to the room pass
// -----------------------------------------------------------------------------
SweepReport CleanupSweep::run() {
  const std::int64_t now = time_provider_.now_ms();
  SweepReport report;

  sweepConnections(now, report);
  sweepSubscriptions(report);
  sweepRooms(now, report);

  if (report.connections_removed > 0 || report.rooms_removed > 0 ||
      report.events_expired > 0 || report.errors > 0) {
    std::cout << "[CleanupSweep] connections=" << report.connections_removed
              << " subscriptions=" << report.subscriptions_removed
              << " events=" << report.events_expired
              << " rooms=" << report.rooms_removed
              << " errors=" << report.errors << std::endl;
  }
  return report;
}

// -----------------------------------------------------------------------------
// sweepConnections
// -----------------------------------------------------------------------------
void CleanupSweep::sweepConnections(std::int64_t now, SweepReport& report) {
  for (const auto& connection_id : store_.listConnectionIds()) {
    auto connection = store_.getConnection(connection_id);
    if (!connection) {
      ++report.errors;
      continue;
    }
    if (elapsed_since(now, connection->last_activity_ms) <=
        connection_timeout_ms_) {
      continue;
    }

    Status removed = registry_.removeConnection(connection_id);
    if (!removed.ok()) {
      ++report.errors;
      continue;
    }
    ++report.connections_removed;
    if (store_.removeSubscription(connection_id)) {
      ++report.subscriptions_removed;
    }
    bus_.publish(ConnectionClosed{connection_id, connection->room_id,
                                  "timeout"});
  }
}

// -----------------------------------------------------------------------------
// sweepSubscriptions: drop subscriptions orphaned by some other removal path
// -----------------------------------------------------------------------------
void CleanupSweep::sweepSubscriptions(SweepReport& report) {
  for (const auto& connection_id : store_.listSubscriptionIds()) {
    if (!store_.getConnection(connection_id) &&
        store_.removeSubscription(connection_id)) {
      ++report.subscriptions_removed;
    }
  }
}

// -----------------------------------------------------------------------------
// sweepRooms
// -----------------------------------------------------------------------------
void CleanupSweep::sweepRooms(std::int64_t now, SweepReport& report) {
  for (const auto& room_id : store_.listRoomIds()) {
    auto room = store_.getRoom(room_id);
    if (!room) {
      ++report.errors;
      continue;
    }

    if (room->connection_ids.empty() &&
        elapsed_since(now, room->last_activity_ms) > connection_timeout_ms_) {
      if (store_.removeRoom(room_id)) {
        ++report.rooms_removed;
      } else {
        ++report.errors;
      }
      continue;
    }

    // The buffer is ordered by time, so expired events form a prefix.
    std::size_t expired = 0;
    while (!room->event_buffer.empty() &&
           elapsed_since(now, room->event_buffer.front().timestamp_ms) >
               max_event_age_ms_) {
      room->event_buffer.pop_front();
      ++expired;
    }
    if (expired > 0) {
      report.events_expired += expired;
      store_.putRoom(*room);
    }
  }
}

}  // namespace relay
