#pragma once

#include "relay/events/stream_event.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// Notification types
// -----------------------------------------------------------------------------
// These are internal announcements published on the request loop's EventBus
// after the core has changed state. They are how the core talks to the
// transport layer (IpcServer) and to observers (logging, tests) without
// depending on either.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// EventBroadcast
// -----------------------------------------------------------------------------
// A StreamEvent was appended to a room. `targets` is the fan-out set: the
// connection ids in the room at the moment of the broadcast. The transport
// must push the framed event to each of them.
// -----------------------------------------------------------------------------
struct EventBroadcast {
  std::string room_id;
  StreamEvent event;
  std::vector<std::string> targets;
};

// -----------------------------------------------------------------------------
// ConnectionClosed
// -----------------------------------------------------------------------------
// A connection left its room, either explicitly or because the cleanup sweep
// timed it out. The transport should close the client stream.
// -----------------------------------------------------------------------------
struct ConnectionClosed {
  std::string connection_id;
  std::string room_id;
  std::string reason;  // "unsubscribe" or "timeout"
};

// -----------------------------------------------------------------------------
// SummaryRefreshed
// -----------------------------------------------------------------------------
// The global market summary was overwritten with fresh provider data.
// -----------------------------------------------------------------------------
struct SummaryRefreshed {
  std::size_t symbol_count{0};
  std::size_t failed_count{0};
  std::int64_t cached_at_ms{0};
};

// -----------------------------------------------------------------------------
// SweepCompleted
// -----------------------------------------------------------------------------
// One maintenance pass finished. Counts are for observability only.
// -----------------------------------------------------------------------------
struct SweepCompleted {
  std::size_t connections_removed{0};
  std::size_t rooms_removed{0};
  std::size_t events_expired{0};
  std::size_t cache_entries_purged{0};
};

// -----------------------------------------------------------------------------
// Notification (variant envelope)
// -----------------------------------------------------------------------------
// One value type for every announcement so a single EventBus carries all of
// them; subscribers pick the alternative they care about with the typed
// subscribe<T>() overload.
// -----------------------------------------------------------------------------
using Notification = std::variant<
    EventBroadcast,
    ConnectionClosed,
    SummaryRefreshed,
    SweepCompleted>;

}  // namespace relay
