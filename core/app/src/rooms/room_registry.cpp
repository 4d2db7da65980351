#include "relay/rooms/room_registry.hpp"

#include <algorithm>
#include <iostream>

namespace relay {

namespace {

bool containsId(const std::vector<std::string>& ids, const std::string& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

void eraseId(std::vector<std::string>& ids, const std::string& id) {
  ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

}  // namespace

RoomRegistry::RoomRegistry(IStateStore& store,
                           const ITimeProvider& time_provider,
                           const domain::BrokerConfig& config)
    : store_(store),
      time_provider_(time_provider),
      max_connections_per_room_(config.max_connections_per_room),
      default_buffer_size_(config.max_buffer_size_per_room) {}

// -----------------------------------------------------------------------------
// ensureRoom: idempotent create-if-absent
// -----------------------------------------------------------------------------
domain::Room RoomRegistry::ensureRoom(
    const std::string& room_id, std::optional<std::size_t> max_buffer_size) {
  if (auto existing = store_.getRoom(room_id)) {
    return *existing;
  }

  const std::int64_t now = time_provider_.now_ms();
  domain::Room room;
  room.room_id = room_id;
  room.max_buffer_size = max_buffer_size.value_or(default_buffer_size_);
  room.created_at_ms = now;
  room.last_activity_ms = now;
  store_.putRoom(room);

  std::cout << "[RoomRegistry] created room=" << room_id
            << " buffer=" << room.max_buffer_size << std::endl;
  return room;
}

// -----------------------------------------------------------------------------
// addConnection: admission check first, then write both records
// -----------------------------------------------------------------------------
Status RoomRegistry::addConnection(const std::string& room_id,
                                   const std::string& connection_id,
                                   const std::string& peer_id,
                                   std::optional<std::uint64_t> last_event_id,
                                   std::optional<std::size_t> max_buffer_size) {
  domain::Room room = ensureRoom(room_id, max_buffer_size);
  const std::int64_t now = time_provider_.now_ms();

  const bool already_member = containsId(room.connection_ids, connection_id);
  if (!already_member &&
      room.connection_ids.size() >= max_connections_per_room_) {
    std::cerr << "[RoomRegistry] admission rejected for room=" << room_id
              << " (limit=" << max_connections_per_room_ << ")" << std::endl;
    return makeError(ErrorCode::AdmissionRejected,
                     "room " + room_id + " is at its connection limit");
  }

  // Moving between rooms: detach from the previous room once admission to
  // the new one is certain.
  if (auto previous = store_.getConnection(connection_id)) {
    if (previous->room_id != room_id) {
      if (auto old_room = store_.getRoom(previous->room_id)) {
        eraseId(old_room->connection_ids, connection_id);
        old_room->last_activity_ms = now;
        store_.putRoom(*old_room);
      }
    }
  }

  domain::Connection connection;
  connection.connection_id = connection_id;
  connection.room_id = room_id;
  connection.peer_id = peer_id;
  connection.last_event_id = last_event_id;
  connection.connected_at_ms = now;
  connection.last_activity_ms = now;

  if (!already_member) {
    room.connection_ids.push_back(connection_id);
  }
  room.last_activity_ms = now;

  store_.putConnection(connection);
  store_.putRoom(room);
  return okStatus();
}

// -----------------------------------------------------------------------------
// removeConnection
// -----------------------------------------------------------------------------
Status RoomRegistry::removeConnection(const std::string& connection_id) {
  auto connection = store_.getConnection(connection_id);
  if (!connection) {
    return makeError(ErrorCode::NotFound,
                     "connection " + connection_id + " not found");
  }

  if (auto room = store_.getRoom(connection->room_id)) {
    eraseId(room->connection_ids, connection_id);
    room->last_activity_ms = time_provider_.now_ms();
    store_.putRoom(*room);
  }

  store_.removeConnection(connection_id);
  return okStatus();
}

// -----------------------------------------------------------------------------
// touchConnection
// -----------------------------------------------------------------------------
Status RoomRegistry::touchConnection(const std::string& connection_id) {
  auto connection = store_.getConnection(connection_id);
  if (!connection) {
    return makeError(ErrorCode::NotFound,
                     "connection " + connection_id + " not found");
  }
  connection->last_activity_ms = time_provider_.now_ms();
  store_.putConnection(*connection);
  return okStatus();
}

std::optional<domain::Connection> RoomRegistry::connection(
    const std::string& connection_id) const {
  return store_.getConnection(connection_id);
}

bool RoomRegistry::hasRoom(const std::string& room_id) const {
  return store_.getRoom(room_id).has_value();
}

// -----------------------------------------------------------------------------
// Statistics
// -----------------------------------------------------------------------------
Result<RoomStats> RoomRegistry::roomStats(const std::string& room_id) const {
  auto room = store_.getRoom(room_id);
  if (!room) {
    return makeError(ErrorCode::NotFound, "room " + room_id + " not found");
  }
  return RoomStats{room->connection_ids.size(), room->event_buffer.size()};
}

GlobalStats RoomRegistry::globalStats() const {
  GlobalStats stats;
  for (const auto& room_id : store_.listRoomIds()) {
    if (auto room = store_.getRoom(room_id)) {
      ++stats.rooms;
      stats.buffered_events += room->event_buffer.size();
    }
  }
  stats.connections = store_.listConnectionIds().size();
  return stats;
}

}  // namespace relay
