#include "relay/rooms/replay_service.hpp"

namespace relay {

ReplayService::ReplayService(const IStateStore& store) : store_(store) {}

Result<std::vector<StreamEvent>> ReplayService::eventsSince(
    const std::string& room_id,
    std::optional<std::uint64_t> last_event_id) const {
  auto room = store_.getRoom(room_id);
  if (!room) {
    return makeError(ErrorCode::NotFound, "room " + room_id + " not found");
  }

  std::vector<StreamEvent> events;
  events.reserve(room->event_buffer.size());
  for (const auto& event : room->event_buffer) {
    if (!last_event_id || event.id > *last_event_id) {
      events.push_back(event);
    }
  }
  return events;
}

}  // namespace relay
