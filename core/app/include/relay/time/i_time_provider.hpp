#pragma once

#include <cstdint>

namespace relay {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where "now" comes from.
//
// @details
// Every freshness decision in the broker is a wall-clock comparison: cache
// expiry, the rate-limit window, connection timeouts, event age, the summary
// TTL and the activity window. If components called
// std::chrono::system_clock::now() directly, none of those thresholds could
// be tested without sleeping for minutes or hours.
//
// ITimeProvider solves this with dependency injection:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value the test (or a replay harness)
//                              sets explicitly.
//
// Components receive `const ITimeProvider&` and call now_ms() whenever they
// need a timestamp.
//
// Units: int64_t milliseconds since the Unix epoch. All durations in
// BrokerConfig use the same unit so comparisons never need conversions.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. The broker core only
//   reads time from the request loop, but the timer host and the provider
//   worker thread may read it too.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // @return int64_t  Epoch milliseconds. May be 0 for a simulation clock that
  //         has not been advanced yet.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace relay
