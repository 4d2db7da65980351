#pragma once

#include "relay/events/event_kind.hpp"

#include <cstdint>
#include <string>

namespace relay {

// -----------------------------------------------------------------------------
// StreamEvent
// -----------------------------------------------------------------------------
// Responsibility: One broadcast event as retained in a room's buffer and
// replayed to reconnecting subscribers.
//
// Created only by BroadcastEngine, immutable afterwards, destroyed only by
// buffer eviction or the age sweep. The payload is already-serialised JSON
// text; the broker never interprets it.
// -----------------------------------------------------------------------------
struct StreamEvent {
  std::uint64_t id{0};            // Process-wide monotonic id (never 0)
  EventKind kind{EventKind::RoomState};
  std::string payload;            // Opaque serialised payload
  std::int64_t timestamp_ms{0};   // When the event was broadcast
};

}  // namespace relay
