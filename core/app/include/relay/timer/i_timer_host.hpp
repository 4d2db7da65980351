#pragma once

#include <cstdint>
#include <functional>

namespace relay {

// -----------------------------------------------------------------------------
// ITimerHost: periodic callback service
// -----------------------------------------------------------------------------
//
// @brief  "Invoke this callback no more often than every T" plus cancel.
//
// @details
// Consumers (RefreshScheduler, the engine's maintenance tick) assume at least
// one tick per interval but tolerate missed ticks; nothing relies on exact
// spacing.
//
// Callback contract:
//   Callbacks run on the REQUEST LOOP, never concurrently with a request
//   handler. A callback may cancel its own timer (or any other) from inside
//   the callback. After cancel(id) returns, the callback of `id` is not
//   invoked again.
//
// Implementations:
//   - LoopTimerHost    → steady_clock timer thread that posts onto the
//                        request loop (executable).
//   - ManualTimerHost  → fired explicitly by the caller (tests).
// -----------------------------------------------------------------------------
class ITimerHost {
 public:
  using TimerId = std::uint64_t;
  using Callback = std::function<void()>;

  virtual ~ITimerHost() = default;

  // Returns a non-zero id for cancel().
  virtual TimerId scheduleEvery(std::int64_t interval_ms, Callback callback) = 0;

  // Unknown or already-cancelled ids are ignored.
  virtual void cancel(TimerId id) = 0;
};

}  // namespace relay
