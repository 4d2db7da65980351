#include "relay/identity/token_identity_verifier.hpp"

#include <utility>

namespace relay {

TokenIdentityVerifier::TokenIdentityVerifier(
    std::map<std::string, std::string> tokens)
    : tokens_(std::move(tokens)) {}

Result<std::string> TokenIdentityVerifier::verifyCaller(
    const std::string& credential) const {
  if (credential.empty()) {
    return makeError(ErrorCode::Unauthorized, "missing credential");
  }
  auto it = tokens_.find(credential);
  if (it == tokens_.end()) {
    return makeError(ErrorCode::Unauthorized, "credential not recognised");
  }
  return it->second;
}

std::string anonymousPeerId(const std::string& connection_id) {
  return "anon-" + connection_id;
}

}  // namespace relay
