#pragma once

#include "relay/timer/i_timer_host.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace relay {

// -----------------------------------------------------------------------------
// RefreshScheduler: self-cancelling periodic summary refresh
// -----------------------------------------------------------------------------
//
// @brief  Two-state machine: Idle (no timer) and Refreshing (one periodic
//         timer scheduled on the ITimerHost).
//
// @details
// Transitions:
//   Idle       --ensureRunning()-->             Refreshing (timer scheduled)
//   Refreshing --ensureRunning()-->             Refreshing (no-op)
//   Refreshing --tick(), activity recent-->     Refreshing (refresh invoked)
//   Refreshing --tick(), no recent activity-->  Idle       (timer cancelled)
//   any        --stop()-->                      Idle
//
// The scheduler never runs forever against an idle service: each tick asks
// the activity check first and cancels its own timer when nobody has read a
// summary within the activity window. The next read calls ensureRunning()
// again.
//
// Refresh failures are the refresh action's business (it logs them). A
// failed refresh leaves the scheduler in Refreshing; the next tick retries.
//
// The refresh action may run concurrently (in the run-to-completion sense)
// with request-triggered refreshes; coalescing is handled by the action.
//
// Thread model: Request loop only. The timer host delivers ticks there.
// -----------------------------------------------------------------------------
class RefreshScheduler {
 public:
  enum class State { Idle, Refreshing };

  using ActivityProbe = std::function<bool()>;
  using RefreshAction = std::function<void()>;

  RefreshScheduler(ITimerHost& timers, std::int64_t interval_ms,
                   ActivityProbe has_recent_activity, RefreshAction refresh);

  // Cancels the timer if one is scheduled.
  ~RefreshScheduler();

  RefreshScheduler(const RefreshScheduler&) = delete;
  RefreshScheduler& operator=(const RefreshScheduler&) = delete;

  void ensureRunning();

  // One periodic tick. Public so the timer callback and tests share a path.
  void tick();

  // Explicit shutdown. Idempotent.
  void stop();

  State state() const { return state_; }

  // Ticks that actually invoked the refresh action.
  std::size_t refreshesTriggered() const { return refreshes_triggered_; }

 private:
  ITimerHost& timers_;
  const std::int64_t interval_ms_;
  ActivityProbe has_recent_activity_;
  RefreshAction refresh_;

  State state_{State::Idle};
  ITimerHost::TimerId timer_id_{0};
  std::size_t refreshes_triggered_{0};
};

const char* refreshStateToString(RefreshScheduler::State state);

}  // namespace relay
