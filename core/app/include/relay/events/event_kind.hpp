#pragma once

#include <optional>
#include <string_view>

namespace relay {

// -----------------------------------------------------------------------------
// EventKind
// -----------------------------------------------------------------------------
// Responsibility: Tag carried by every stream event. Rendered as the `event:`
// line of the stream framing, so the wire names below are part of the client
// contract.
//
// Signaling kinds (peer-to-peer session setup inside a room):
//   PeerJoined, PeerLeft, Offer, Answer, IceCandidate, RoomState
// Market data kinds (stock and summary rooms):
//   PriceUpdate, NewsUpdate, MarketSummary
//
// Adding a kind means adding it here and to both conversion functions; the
// switch in eventKindToString() makes the compiler flag a missing case.
// -----------------------------------------------------------------------------
enum class EventKind {
  PeerJoined,
  PeerLeft,
  Offer,
  Answer,
  IceCandidate,
  RoomState,
  PriceUpdate,
  NewsUpdate,
  MarketSummary
};

// "peer-joined", "ice-candidate", "market-summary", ...
const char* eventKindToString(EventKind kind);

// Inverse of eventKindToString(). std::nullopt for unknown names.
std::optional<EventKind> eventKindFromString(std::string_view name);

}  // namespace relay
