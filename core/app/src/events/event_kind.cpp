#include "relay/events/event_kind.hpp"

#include <array>
#include <utility>

namespace relay {

namespace {

constexpr std::array<EventKind, 9> kAllKinds = {
    EventKind::PeerJoined,   EventKind::PeerLeft,    EventKind::Offer,
    EventKind::Answer,       EventKind::IceCandidate, EventKind::RoomState,
    EventKind::PriceUpdate,  EventKind::NewsUpdate,  EventKind::MarketSummary};

}  // namespace

// -----------------------------------------------------------------------------
// eventKindToString()
// -----------------------------------------------------------------------------
const char* eventKindToString(EventKind kind) {
  switch (kind) {
    case EventKind::PeerJoined:    return "peer-joined";
    case EventKind::PeerLeft:      return "peer-left";
    case EventKind::Offer:         return "offer";
    case EventKind::Answer:        return "answer";
    case EventKind::IceCandidate:  return "ice-candidate";
    case EventKind::RoomState:     return "room-state";
    case EventKind::PriceUpdate:   return "price-update";
    case EventKind::NewsUpdate:    return "news-update";
    case EventKind::MarketSummary: return "market-summary";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// eventKindFromString(): linear scan, the set is tiny
// -----------------------------------------------------------------------------
std::optional<EventKind> eventKindFromString(std::string_view name) {
  for (EventKind kind : kAllKinds) {
    if (name == eventKindToString(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace relay
