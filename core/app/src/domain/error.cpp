#include "relay/domain/error.hpp"

namespace relay {

// -----------------------------------------------------------------------------
// errorCodeToString()
// -----------------------------------------------------------------------------
const char* errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound:          return "not_found";
    case ErrorCode::AdmissionRejected: return "admission_rejected";
    case ErrorCode::ProviderFailure:   return "provider_failure";
    case ErrorCode::Unauthorized:      return "unauthorized";
    case ErrorCode::InvalidInput:      return "invalid_input";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// isRetryable()
// -----------------------------------------------------------------------------
bool isRetryable(ErrorCode code) {
  return code == ErrorCode::AdmissionRejected ||
         code == ErrorCode::ProviderFailure;
}

}  // namespace relay
