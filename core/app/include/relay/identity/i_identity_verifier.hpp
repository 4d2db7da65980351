#pragma once

#include "relay/domain/error.hpp"

#include <string>

namespace relay {

// -----------------------------------------------------------------------------
// IIdentityVerifier: maps a caller credential to a stable peer id
// -----------------------------------------------------------------------------
// Consulted before admitting a connection to a room that requires
// authentication. The credential arrives as a plain value; extracting it
// from headers or query parameters is the transport's job.
//
// Returns the peer id, or Unauthorized.
// -----------------------------------------------------------------------------
class IIdentityVerifier {
 public:
  virtual ~IIdentityVerifier() = default;

  virtual Result<std::string> verifyCaller(const std::string& credential) const = 0;
};

}  // namespace relay
