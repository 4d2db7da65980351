#pragma once

#include "relay/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace relay {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         rather than read from the system clock.
//
// @details
// The broker's policies are all expressed as thresholds over elapsed time
// (45 minute cache duration, 30 second rate-limit window, 5 minute connection
// timeout, 6 hour activity window). Tests construct a SimulationTimeProvider,
// hand it to the components under test, and step it across those thresholds
// with advance_time() / advance_by().
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_. Lock-free on 64-bit platforms, so
//   the timer host thread and the request loop can both read it while a test
//   thread advances it.
//
// Thread model:
//   now_ms() may be called from any thread. advance_time() / advance_by()
//   are intended for a single writer (the test body or replay harness).
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at 0 ms unless told otherwise.
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  // -------------------------------------------------------------------------
  // now_ms() override
  // -------------------------------------------------------------------------
  // @brief  Returns the last time set by advance_time() / advance_by().
  // -------------------------------------------------------------------------
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute timestamp.
  //
  // @param  new_time_ms  Epoch milliseconds. Monotonicity is the caller's
  //                      responsibility; setting an earlier time is allowed
  //                      so tests can construct arbitrary scenarios.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // advance_by(delta_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by a relative amount.
  //
  // @param  delta_ms  Milliseconds to add to the current value.
  // -------------------------------------------------------------------------
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace relay
