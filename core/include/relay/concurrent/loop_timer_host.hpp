#pragma once

#include "relay/concurrent/event_loop_thread.hpp"
#include "relay/timer/i_timer_host.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace relay {

// -----------------------------------------------------------------------------
// LoopTimerHost
// -----------------------------------------------------------------------------
// Responsibility: ITimerHost for the running broker. A dedicated timer thread
// watches steady_clock deadlines; when one passes, it POSTS the callback to
// the request loop instead of running it. Timer callbacks therefore obey the
// same run-to-completion rule as requests.
//
// Cancellation: a tick may already be queued on the loop when cancel() is
// called. The posted task re-checks the timer table on the loop and does
// nothing if the id is gone, so a cancelled callback never runs afterwards.
//
// Missed ticks: if the loop is busy for longer than an interval, the next
// deadline is computed from "now", not accumulated. At most one tick per
// timer is outstanding per interval.
//
// Thread model: scheduleEvery() and cancel() are safe from any thread.
// Callbacks run on the loop thread.
// -----------------------------------------------------------------------------
class LoopTimerHost final : public ITimerHost {
 public:
  explicit LoopTimerHost(EventLoopThread& loop);
  ~LoopTimerHost() override;

  LoopTimerHost(const LoopTimerHost&) = delete;
  LoopTimerHost& operator=(const LoopTimerHost&) = delete;

  void start();
  void stop();

  TimerId scheduleEvery(std::int64_t interval_ms, Callback callback) override;
  void cancel(TimerId id) override;

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    std::chrono::milliseconds interval{0};
    Clock::time_point next_due;
    Callback callback;
  };

  void run();

  // Runs on the loop: looks the timer up again and invokes it if still live.
  void dispatch(TimerId id);

  EventLoopThread& loop_;

  std::mutex mutex_;                 // Protects timers_ and next_id_
  std::condition_variable wake_cv_;  // Schedule changes and stop()
  std::map<TimerId, Entry> timers_;
  TimerId next_id_{1};

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace relay
