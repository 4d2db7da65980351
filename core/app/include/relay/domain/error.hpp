#pragma once

#include <string>
#include <utility>
#include <variant>

namespace relay {

// -----------------------------------------------------------------------------
// ErrorCode: the broker's failure taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Closed set of recoverable failures. Each one is a normal outcome of
//         a request, not a programming error, so it travels as a value.
//
//   NotFound          Room, connection or cache key absent. Callers may
//                     create on demand or report empty.
//   AdmissionRejected Room at its connection limit. Retryable.
//   ProviderFailure   External data fetch failed. Any prior cached value is
//                     left intact, never silently served.
//   Unauthorized      Private room and the credential did not verify.
//   InvalidInput      Malformed command, unknown event kind, bad config.
//
// A malformed replay cursor is deliberately NOT an error: it parses to "no
// cursor" and the caller receives the whole buffer.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  NotFound,
  AdmissionRejected,
  ProviderFailure,
  Unauthorized,
  InvalidInput
};

// Stable wire name, e.g. "admission_rejected".
const char* errorCodeToString(ErrorCode code);

// AdmissionRejected and ProviderFailure may succeed if retried later.
bool isRetryable(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::InvalidInput};
  std::string message;
};

inline Error makeError(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

// -----------------------------------------------------------------------------
// Result<T>
// -----------------------------------------------------------------------------
//
// @brief  Either a T or an Error. Thin wrapper over std::variant so call
//         sites read `if (!r.ok()) return r.error();` instead of get_if.
//
// @details
// Value semantics throughout: results are moved into callbacks that cross
// the provider suspension point, so both alternatives must be cheap to move.
// value() on an error result (or error() on a value) throws
// std::bad_variant_access; callers are expected to test ok() first.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : storage_(std::move(value)) {}   // NOLINT(implicit)
  Result(Error error) : storage_(std::move(error)) {}  // NOLINT(implicit)

  bool ok() const { return std::holds_alternative<T>(storage_); }
  explicit operator bool() const { return ok(); }

  const T& value() const& { return std::get<T>(storage_); }
  T& value() & { return std::get<T>(storage_); }
  T&& value() && { return std::get<T>(std::move(storage_)); }

  const Error& error() const { return std::get<Error>(storage_); }

  ErrorCode code() const { return error().code; }

 private:
  std::variant<T, Error> storage_;
};

// Result of an operation that produces no value.
using Status = Result<std::monostate>;

inline Status okStatus() { return Status(std::monostate{}); }

}  // namespace relay
