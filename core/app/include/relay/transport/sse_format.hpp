#pragma once

#include "relay/events/stream_event.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// Event-stream framing
// -----------------------------------------------------------------------------
// Text rendering handed to the transport boundary. One event:
//
//   id: <id>\n
//   event: <kind wire name>\n
//   data: <payload>\n
//   \n
//
// A stream may start with a reconnect hint "retry: <ms>\n\n".
//
// A payload containing line breaks (LF, CR or CRLF) is split into one
// "data: " line per payload line, so a client reassembles the original text
// joined by LF and no payload can end a frame or start a forged one.
// -----------------------------------------------------------------------------

std::string formatEvent(const StreamEvent& event);

std::string formatRetryHint(std::int64_t retry_ms);

// Optional retry hint followed by every event in order.
std::string renderStream(const std::vector<StreamEvent>& events,
                         std::optional<std::int64_t> retry_ms = std::nullopt);

// -----------------------------------------------------------------------------
// parseLastEventId(text)
// -----------------------------------------------------------------------------
// Decodes the client's Last-Event-ID. Surrounding whitespace is ignored.
// Empty, non-numeric, signed, or out-of-range text yields std::nullopt,
// which callers treat as "replay the whole buffer". Never an error.
// -----------------------------------------------------------------------------
std::optional<std::uint64_t> parseLastEventId(std::string_view text);

}  // namespace relay
