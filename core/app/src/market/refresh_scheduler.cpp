#include "relay/market/refresh_scheduler.hpp"

#include <iostream>
#include <utility>

namespace relay {

RefreshScheduler::RefreshScheduler(ITimerHost& timers,
                                   std::int64_t interval_ms,
                                   ActivityProbe has_recent_activity,
                                   RefreshAction refresh)
    : timers_(timers),
      interval_ms_(interval_ms),
      has_recent_activity_(std::move(has_recent_activity)),
      refresh_(std::move(refresh)) {}

RefreshScheduler::~RefreshScheduler() {
  if (state_ == State::Refreshing) {
    timers_.cancel(timer_id_);
  }
}

// -----------------------------------------------------------------------------
// ensureRunning: Idle → Refreshing
// -----------------------------------------------------------------------------
void RefreshScheduler::ensureRunning() {
  if (state_ == State::Refreshing) {
    return;
  }
  timer_id_ = timers_.scheduleEvery(interval_ms_, [this] { tick(); });
  state_ = State::Refreshing;
  std::cout << "[RefreshScheduler] Idle -> Refreshing (every "
            << interval_ms_ << " ms)" << std::endl;
}

// -----------------------------------------------------------------------------
// tick: refresh while someone is watching, otherwise go Idle
// -----------------------------------------------------------------------------
void RefreshScheduler::tick() {
  if (state_ != State::Refreshing) {
    return;
  }

  if (!has_recent_activity_()) {
    std::cout << "[RefreshScheduler] no recent activity, stopping"
              << std::endl;
    stop();
    return;
  }

  ++refreshes_triggered_;
  refresh_();
}

// -----------------------------------------------------------------------------
// stop: any → Idle
// -----------------------------------------------------------------------------
void RefreshScheduler::stop() {
  if (state_ == State::Idle) {
    return;
  }
  timers_.cancel(timer_id_);
  timer_id_ = 0;
  state_ = State::Idle;
  std::cout << "[RefreshScheduler] Refreshing -> Idle" << std::endl;
}

const char* refreshStateToString(RefreshScheduler::State state) {
  switch (state) {
    case RefreshScheduler::State::Idle:       return "idle";
    case RefreshScheduler::State::Refreshing: return "refreshing";
  }
  return "unknown";
}

}  // namespace relay
