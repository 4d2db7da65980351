#pragma once

#include "relay/concurrent/event_id_generator.hpp"
#include "relay/domain/error.hpp"
#include "relay/eventbus/event_bus.hpp"
#include "relay/events/event_kind.hpp"
#include "relay/rooms/room_registry.hpp"
#include "relay/store/i_state_store.hpp"
#include "relay/time/i_time_provider.hpp"

#include <string>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// BroadcastEngine: appends events to room buffers
// -----------------------------------------------------------------------------
//
// @brief  Stamps an event with the next process-wide id, appends it to the
//         room's bounded buffer and returns the fan-out target list.
//
// @details
// Steps of broadcast(room_id, kind, payload):
//   1. id = EventIdGenerator::next_id()
//   2. StreamEvent{id, kind, payload, now}
//   3. Load the room, creating it through RoomRegistry::ensureRoom() when
//      it does not exist yet. The first event sent to a new room is
//      retained for later subscribers instead of being dropped.
//   4. Append; pop the front while size() > max_buffer_size.
//   5. room.last_activity = now; persist.
//   6. Publish EventBroadcast{room_id, event, targets} on the bus and return
//      targets (the room's connection ids at this moment).
//
// The engine never delivers bytes. Delivery is the transport's job: the IPC
// server subscribes to EventBroadcast and frames the event for each target.
//
// Ids are allocated before the room is loaded and every allocated id is
// stored, so ids in one room's buffer are strictly increasing and the
// generator introduces no gaps.
//
// Thread model:
//   Request loop only. The bus callbacks run synchronously inside
//   broadcast(), still on the loop.
// -----------------------------------------------------------------------------
class BroadcastEngine {
 public:
  BroadcastEngine(IStateStore& store, RoomRegistry& registry,
                  EventIdGenerator& ids, const ITimeProvider& time_provider,
                  EventBus& bus);

  BroadcastEngine(const BroadcastEngine&) = delete;
  BroadcastEngine& operator=(const BroadcastEngine&) = delete;

  // -------------------------------------------------------------------------
  // broadcast(room_id, kind, payload)
  // -------------------------------------------------------------------------
  // @param  payload  Serialised payload text, stored and emitted verbatim.
  //
  // @return Connection ids to deliver to (possibly empty), or InvalidInput
  //         for an empty room id.
  // -------------------------------------------------------------------------
  Result<std::vector<std::string>> broadcast(const std::string& room_id,
                                             EventKind kind,
                                             std::string payload);

 private:
  IStateStore& store_;
  RoomRegistry& registry_;
  EventIdGenerator& ids_;
  const ITimeProvider& time_provider_;
  EventBus& bus_;
};

}  // namespace relay
