#pragma once

#include "relay/identity/i_identity_verifier.hpp"

#include <map>
#include <string>

namespace relay {

// -----------------------------------------------------------------------------
// TokenIdentityVerifier
// -----------------------------------------------------------------------------
// Responsibility: IIdentityVerifier over a static token → peer id table
// (BrokerConfig::access_tokens). Empty or unknown credentials are
// Unauthorized.
//
// Thread model: Immutable after construction; safe from any thread.
// -----------------------------------------------------------------------------
class TokenIdentityVerifier final : public IIdentityVerifier {
 public:
  explicit TokenIdentityVerifier(std::map<std::string, std::string> tokens);

  Result<std::string> verifyCaller(const std::string& credential) const override;

 private:
  const std::map<std::string, std::string> tokens_;
};

// Peer id given to callers admitted to a public room without a credential.
std::string anonymousPeerId(const std::string& connection_id);

}  // namespace relay
