#include "relay/events/payloads.hpp"

#include <nlohmann/json.hpp>

namespace relay {

namespace {

// Offer and answer share a shape; only the event kind differs.
std::string sessionDescription(const std::string& from, const std::string& to,
                               const std::string& sdp) {
  nlohmann::json j;
  j["from"] = from;
  j["to"] = to;
  j["sdp"] = sdp;
  return j.dump();
}

}  // namespace

std::string peerJoinedPayload(const std::string& peer_id,
                              const PayloadMeta& meta) {
  nlohmann::json j;
  j["peerId"] = peer_id;
  j["meta"] = meta;
  return j.dump();
}

std::string peerLeftPayload(const std::string& peer_id) {
  nlohmann::json j;
  j["peerId"] = peer_id;
  return j.dump();
}

std::string offerPayload(const std::string& from, const std::string& to,
                         const std::string& sdp) {
  return sessionDescription(from, to, sdp);
}

std::string answerPayload(const std::string& from, const std::string& to,
                          const std::string& sdp) {
  return sessionDescription(from, to, sdp);
}

std::string iceCandidatePayload(const std::string& from, const std::string& to,
                                const PayloadMeta& candidate) {
  nlohmann::json j;
  j["from"] = from;
  j["to"] = to;
  j["candidate"] = candidate;
  return j.dump();
}

std::string roomStatePayload(const std::vector<std::string>& peers,
                             const PayloadMeta& meta) {
  nlohmann::json j;
  j["peers"] = peers;
  j["meta"] = meta;
  return j.dump();
}

}  // namespace relay
