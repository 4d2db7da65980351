#include "relay/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace relay {

namespace {

// Idle wait before re-checking running_. Short enough that stop() and newly
// posted tasks are picked up promptly.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

// -----------------------------------------------------------------------------
// Destructor
// -----------------------------------------------------------------------------
EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  // Set before the thread exists so its first check sees true.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  stop_cv_.notify_all();

  // No lock held across join(); the worker may need stop_mutex_ to exit.
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Task> task = queue_.try_pop();

    if (task) {
      // A task that throws is a bug in that handler. Report it and keep the
      // loop alive for every other room and connection.
      try {
        (*task)();
      } catch (const std::exception& e) {
        std::cerr << "[EventLoopThread] task failed: " << e.what()
                  << std::endl;
      }
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace relay
