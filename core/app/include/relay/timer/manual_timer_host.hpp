#pragma once

#include "relay/timer/i_timer_host.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// ManualTimerHost: ITimerHost driven by explicit fire() calls
// -----------------------------------------------------------------------------
//
// @brief  Records scheduled timers; never fires on its own.
//
// @details
// The timer counterpart of SimulationTimeProvider. A test advances the
// simulation clock past an interval and then calls fireAll() to deliver the
// tick that a real host would have delivered. The caller's thread plays the
// role of the request loop.
//
// Firing copies the callback first, so a callback that cancels its own
// timer (RefreshScheduler going Idle) is safe.
//
// Thread model: Single-threaded. Not safe to share with a running loop.
// -----------------------------------------------------------------------------
class ManualTimerHost final : public ITimerHost {
 public:
  TimerId scheduleEvery(std::int64_t interval_ms, Callback callback) override {
    TimerId id = next_id_++;
    timers_[id] = Entry{interval_ms, std::move(callback)};
    return id;
  }

  void cancel(TimerId id) override { timers_.erase(id); }

  // Fires one timer. Returns false when `id` is not scheduled.
  bool fire(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
      return false;
    }
    Callback callback = it->second.callback;
    callback();
    return true;
  }

  // Fires every timer scheduled at the moment of the call, in id order.
  // Returns how many fired.
  std::size_t fireAll() {
    std::vector<TimerId> ids;
    ids.reserve(timers_.size());
    for (const auto& [id, entry] : timers_) {
      ids.push_back(id);
    }
    std::size_t fired = 0;
    for (TimerId id : ids) {
      if (fire(id)) {
        ++fired;
      }
    }
    return fired;
  }

  bool isScheduled(TimerId id) const { return timers_.count(id) > 0; }

  std::size_t activeCount() const { return timers_.size(); }

  // Interval of a scheduled timer, 0 if unknown.
  std::int64_t intervalOf(TimerId id) const {
    auto it = timers_.find(id);
    return it == timers_.end() ? 0 : it->second.interval_ms;
  }

 private:
  struct Entry {
    std::int64_t interval_ms{0};
    Callback callback;
  };

  TimerId next_id_{1};
  std::map<TimerId, Entry> timers_;
};

}  // namespace relay
