#pragma once

#include "relay/domain/error.hpp"
#include "relay/events/stream_event.hpp"
#include "relay/store/i_state_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// ReplayService: "everything after event N" for reconnecting subscribers
// -----------------------------------------------------------------------------
//
// @brief  Reads a room's buffer and filters it by the caller's cursor.
//
// @details
//   last_event_id == nullopt  → the whole buffer, oldest first
//   last_event_id == N        → only events with id > N, buffer order kept
//
// Delivery is best effort within retention. Events evicted from the buffer
// before the subscriber comes back are gone; the subscriber gets whatever is
// still retained (a gap, not an error). A cursor newer than everything
// buffered yields an empty sequence.
//
// Thread model: Request loop only. Read-only.
// -----------------------------------------------------------------------------
class ReplayService {
 public:
  explicit ReplayService(const IStateStore& store);

  // NotFound when the room does not exist.
  Result<std::vector<StreamEvent>> eventsSince(
      const std::string& room_id,
      std::optional<std::uint64_t> last_event_id) const;

 private:
  const IStateStore& store_;
};

}  // namespace relay
