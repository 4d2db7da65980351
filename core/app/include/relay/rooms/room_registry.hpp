#pragma once

#include "relay/domain/broker_config.hpp"
#include "relay/domain/error.hpp"
#include "relay/domain/room.hpp"
#include "relay/store/i_state_store.hpp"
#include "relay/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace relay {

// Per-room counters reported by roomStats().
struct RoomStats {
  std::size_t connections{0};
  std::size_t buffered_events{0};
};

// Process-wide counters reported by globalStats().
struct GlobalStats {
  std::size_t rooms{0};
  std::size_t connections{0};
  std::size_t buffered_events{0};
};

// -----------------------------------------------------------------------------
// RoomRegistry: owner of Room and Connection records
// -----------------------------------------------------------------------------
//
// @brief  Creates rooms on demand, admits and removes connections, and
//         refreshes connection activity.
//
// @details
// Every operation is a read-modify-write of whole records through
// IStateStore. The registry keeps no state of its own, so BroadcastEngine,
// ReplayService and CleanupSweep can work against the same store without
// going through this class.
//
// Admission:
//   add_connection() ensures the room, then rejects with AdmissionRejected
//   while the room already holds max_connections_per_room ids. The check
//   happens BEFORE anything is written, so a rejected request leaves both
//   the room and the connection table exactly as they were.
//
//   Re-registering a connection id already present in the same room
//   refreshes its record (peer, cursor, activity) without adding a second
//   id and without counting against the limit. Re-registering it for a
//   different room moves it: it is admitted to the new room first and only
//   then detached from the old one.
//
// Thread model:
//   Request loop only. Each call runs to completion; there are no
//   suspension points inside the registry.
//
// Ownership:
//   Owned by BrokerEngine via std::unique_ptr. Holds references to the
//   store and time provider, both owned by BrokerEngine and outliving it.
// -----------------------------------------------------------------------------
class RoomRegistry {
 public:
  RoomRegistry(IStateStore& store, const ITimeProvider& time_provider,
               const domain::BrokerConfig& config);

  RoomRegistry(const RoomRegistry&) = delete;
  RoomRegistry& operator=(const RoomRegistry&) = delete;

  // -------------------------------------------------------------------------
  // ensureRoom(room_id, max_buffer_size)
  // -------------------------------------------------------------------------
  // @brief  Returns the room, creating an empty one if it does not exist.
  //
  // @param  max_buffer_size  Buffer bound for a NEW room. Defaults to
  //                          max_buffer_size_per_room. Ignored when the room
  //                          already exists.
  //
  // Side-effects: Persists a new Room record when absent.
  // -------------------------------------------------------------------------
  domain::Room ensureRoom(const std::string& room_id,
                          std::optional<std::size_t> max_buffer_size =
                              std::nullopt);

  // -------------------------------------------------------------------------
  // addConnection(...)
  // -------------------------------------------------------------------------
  // @brief  Admits connection_id into room_id.
  //
  // @return okStatus(), or AdmissionRejected when the room is full.
  //
  // Side-effects: Creates the room if absent, persists the Connection and
  //               the room's connection set, bumps room.last_activity.
  // -------------------------------------------------------------------------
  Status addConnection(const std::string& room_id,
                       const std::string& connection_id,
                       const std::string& peer_id,
                       std::optional<std::uint64_t> last_event_id,
                       std::optional<std::size_t> max_buffer_size =
                           std::nullopt);

  // -------------------------------------------------------------------------
  // removeConnection(connection_id)
  // -------------------------------------------------------------------------
  // @brief  Detaches the connection from its room and deletes the record.
  //
  // @return NotFound for an unknown id. Callers treat that as already gone.
  //
  // If the room record has disappeared in the meantime the connection is
  // still deleted; a connection never outlives its room reference.
  // -------------------------------------------------------------------------
  Status removeConnection(const std::string& connection_id);

  // Refreshes connection.last_activity. NotFound for an unknown id.
  Status touchConnection(const std::string& connection_id);

  std::optional<domain::Connection> connection(
      const std::string& connection_id) const;

  bool hasRoom(const std::string& room_id) const;

  Result<RoomStats> roomStats(const std::string& room_id) const;

  GlobalStats globalStats() const;

 private:
  IStateStore& store_;
  const ITimeProvider& time_provider_;
  const std::size_t max_connections_per_room_;
  const std::size_t default_buffer_size_;
};

}  // namespace relay
