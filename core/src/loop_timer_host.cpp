#include "relay/concurrent/loop_timer_host.hpp"

#include <iostream>
#include <vector>

namespace relay {

namespace {

// Upper bound on one sleep so stop() is observed even with no timers.
constexpr auto kMaxSleep = std::chrono::milliseconds(100);

}  // namespace

LoopTimerHost::LoopTimerHost(EventLoopThread& loop) : loop_(loop) {}

LoopTimerHost::~LoopTimerHost() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void LoopTimerHost::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[LoopTimerHost] started." << std::endl;
}

void LoopTimerHost::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  wake_cv_.notify_all();
  thread_.join();
  std::cout << "[LoopTimerHost] stopped." << std::endl;
}

// -----------------------------------------------------------------------------
// scheduleEvery / cancel
// -----------------------------------------------------------------------------
ITimerHost::TimerId LoopTimerHost::scheduleEvery(std::int64_t interval_ms,
                                                 Callback callback) {
  TimerId id = 0;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
    Entry entry;
    entry.interval = std::chrono::milliseconds(interval_ms);
    entry.next_due = Clock::now() + entry.interval;
    entry.callback = std::move(callback);
    timers_[id] = std::move(entry);
  }
  wake_cv_.notify_all();
  return id;
}

void LoopTimerHost::cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  timers_.erase(id);
}

// -----------------------------------------------------------------------------
// run(): timer thread
// -----------------------------------------------------------------------------
void LoopTimerHost::run() {
  std::unique_lock lock(mutex_);

  while (running_.load()) {
    const auto now = Clock::now();
    auto next_wake = now + kMaxSleep;

    std::vector<TimerId> due;
    for (auto& [id, entry] : timers_) {
      if (entry.next_due <= now) {
        due.push_back(id);
        entry.next_due = now + entry.interval;
      }
      if (entry.next_due < next_wake) {
        next_wake = entry.next_due;
      }
    }

    for (TimerId id : due) {
      loop_.post([this, id] { dispatch(id); });
    }

    wake_cv_.wait_until(lock, next_wake, [this] { return !running_.load(); });
  }
}

// -----------------------------------------------------------------------------
// dispatch(): loop thread
// -----------------------------------------------------------------------------
void LoopTimerHost::dispatch(TimerId id) {
  Callback callback;
  {
    std::lock_guard lock(mutex_);
    auto it = timers_.find(id);
    if (it == timers_.end()) {
      return;
    }
    callback = it->second.callback;
  }
  callback();
}

}  // namespace relay
