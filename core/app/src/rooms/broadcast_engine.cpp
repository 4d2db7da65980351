#include "relay/rooms/broadcast_engine.hpp"

namespace relay {

BroadcastEngine::BroadcastEngine(IStateStore& store, RoomRegistry& registry,
                                 EventIdGenerator& ids,
                                 const ITimeProvider& time_provider,
                                 EventBus& bus)
    : store_(store),
      registry_(registry),
      ids_(ids),
      time_provider_(time_provider),
      bus_(bus) {}

// -----------------------------------------------------------------------------
// broadcast
// -----------------------------------------------------------------------------
Result<std::vector<std::string>> BroadcastEngine::broadcast(
    const std::string& room_id, EventKind kind, std::string payload) {
  if (room_id.empty()) {
    return makeError(ErrorCode::InvalidInput, "room id must not be empty");
  }

  const std::int64_t now = time_provider_.now_ms();

  StreamEvent event;
  event.id = ids_.next_id();
  event.kind = kind;
  event.payload = std::move(payload);
  event.timestamp_ms = now;

  domain::Room room = registry_.ensureRoom(room_id);

  room.event_buffer.push_back(event);
  while (room.event_buffer.size() > room.max_buffer_size) {
    room.event_buffer.pop_front();
  }
  room.last_activity_ms = now;
  store_.putRoom(room);

  std::vector<std::string> targets = room.connection_ids;
  bus_.publish(EventBroadcast{room_id, std::move(event), targets});
  return targets;
}

}  // namespace relay
