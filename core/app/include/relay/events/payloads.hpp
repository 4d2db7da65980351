#pragma once

#include <map>
#include <string>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// Signaling payload builders
// -----------------------------------------------------------------------------
// Responsibility: Produce the JSON text carried as the payload of signaling
// events. BroadcastEngine stores payloads as opaque strings; these helpers
// are the one place that decides their shape, so every producer (engine
// commands, tests) emits the same documents.
//
// Field names are camelCase because browser clients consume them directly:
//   peer-joined    {"peerId": "...", "meta": {...}}
//   peer-left      {"peerId": "..."}
//   offer/answer   {"from": "...", "to": "...", "sdp": "..."}
//   ice-candidate  {"from": "...", "to": "...", "candidate": {...}}
//   room-state     {"peers": [...], "meta": {...}}
// -----------------------------------------------------------------------------
using PayloadMeta = std::map<std::string, std::string>;

std::string peerJoinedPayload(const std::string& peer_id,
                              const PayloadMeta& meta = {});

std::string peerLeftPayload(const std::string& peer_id);

std::string offerPayload(const std::string& from, const std::string& to,
                         const std::string& sdp);

std::string answerPayload(const std::string& from, const std::string& to,
                          const std::string& sdp);

std::string iceCandidatePayload(const std::string& from, const std::string& to,
                                const PayloadMeta& candidate);

std::string roomStatePayload(const std::vector<std::string>& peers,
                             const PayloadMeta& meta = {});

}  // namespace relay
