#pragma once

#include "relay/events/stream_event.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace relay {
namespace domain {

// -----------------------------------------------------------------------------
// Room: a named topic with its subscribers and retained event window
// -----------------------------------------------------------------------------
//
// @brief  Persisted record for one room.
//
// @details
// Invariants maintained by RoomRegistry and BroadcastEngine:
//   - event_buffer.size() <= max_buffer_size; the front is the oldest event.
//   - event ids in event_buffer are strictly increasing front to back.
//   - connection_ids holds each id at most once, in admission order, and
//     its size never exceeds the configured per-room limit.
//
// A room references its connections by id only. The Connection records live
// in the state store under their own key.
// -----------------------------------------------------------------------------
struct Room {
  std::string room_id;
  std::vector<std::string> connection_ids;
  std::deque<StreamEvent> event_buffer;
  std::size_t max_buffer_size{0};
  std::int64_t created_at_ms{0};
  std::int64_t last_activity_ms{0};
};

// -----------------------------------------------------------------------------
// Connection: one subscriber's registration in exactly one room
// -----------------------------------------------------------------------------
struct Connection {
  std::string connection_id;
  std::string room_id;
  std::string peer_id;
  std::optional<std::uint64_t> last_event_id;  // Cursor presented on subscribe
  std::int64_t connected_at_ms{0};
  std::int64_t last_activity_ms{0};
};

// -----------------------------------------------------------------------------
// StockSubscription: links a connection to a symbol's stock room
// -----------------------------------------------------------------------------
//
// @details
// Has its own lifecycle in the store (keyed by connection id) but is removed
// together with the connection by unsubscribe and by the cleanup sweep.
// -----------------------------------------------------------------------------
struct StockSubscription {
  std::string connection_id;
  std::string symbol;
  std::int64_t subscribed_at_ms{0};
  std::optional<std::uint64_t> last_event_id;
};

}  // namespace domain
}  // namespace relay
