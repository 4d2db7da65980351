#pragma once

#include "relay/domain/broker_config.hpp"
#include "relay/eventbus/event_bus.hpp"
#include "relay/rooms/room_registry.hpp"
#include "relay/store/i_state_store.hpp"
#include "relay/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>

namespace relay {

// Outcome of one sweep. Observability only; nothing depends on the numbers.
struct SweepReport {
  std::size_t connections_removed{0};
  std::size_t subscriptions_removed{0};
  std::size_t events_expired{0};
  std::size_t rooms_removed{0};
  std::size_t errors{0};
};

// -----------------------------------------------------------------------------
// CleanupSweep: lazy enforcement of the wall-clock timeouts
// -----------------------------------------------------------------------------
//
// @brief  One best-effort maintenance pass over connections and rooms.
//
// @details
// Timeouts are never enforced by blocking waits; they are evaluated here,
// when the maintenance tick fires.
//
//   Connections:   now - last_activity > connection_timeout → removed via
//                  RoomRegistry, together with any StockSubscription, and a
//                  ConnectionClosed{reason="timeout"} is published.
//   Subscriptions: a subscription whose connection no longer exists is
//                  removed.
//   Rooms:         buffered events with now - timestamp > max_event_age are
//                  dropped; a room with no connections and
//                  now - last_activity > connection_timeout is deleted.
//
// Failures (a record vanishing between listing and use) are counted in
// SweepReport::errors and the pass carries on.
//
// Running run() twice with no activity in between removes nothing the
// second time.
//
// Thread model: Request loop only (posted by the maintenance timer).
// -----------------------------------------------------------------------------
class CleanupSweep {
 public:
  CleanupSweep(IStateStore& store, RoomRegistry& registry,
               const ITimeProvider& time_provider, EventBus& bus,
               const domain::BrokerConfig& config);

  CleanupSweep(const CleanupSweep&) = delete;
  CleanupSweep& operator=(const CleanupSweep&) = delete;

  SweepReport run();

 private:
  void sweepConnections(std::int64_t now, SweepReport& report);
  void sweepSubscriptions(SweepReport& report);
  void sweepRooms(std::int64_t now, SweepReport& report);

  IStateStore& store_;
  RoomRegistry& registry_;
  const ITimeProvider& time_provider_;
  EventBus& bus_;
  const std::int64_t connection_timeout_ms_;
  const std::int64_t max_event_age_ms_;
};

}  // namespace relay
