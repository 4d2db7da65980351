#pragma once

#include "relay/concurrent/thread_safe_queue.hpp"
#include "relay/eventbus/event_bus.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace relay {

// -----------------------------------------------------------------------------
// EventLoopThread: the broker's request loop
// -----------------------------------------------------------------------------
// Responsibility: Owns a single worker thread that drains a
// ThreadSafeQueue<Task> and runs each task to completion, one at a time.
// Every broker state mutation is a task on this loop: command handlers,
// provider completions, timer ticks. No two tasks ever overlap, so the
// components behind the loop need no locks.
//
// Suspension points are expressed as task boundaries. A handler that needs
// the data provider issues the fetch and returns; the provider posts the
// completion back here as a new task. Anything may run in between.
//
// The loop also owns the EventBus on which the core publishes notifications.
// Publishing happens inside tasks, so subscribers run on the loop thread.
//
// Thread model: start(), stop() and post() may be called from any thread.
// Tasks and EventBus callbacks run on the worker thread only.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  using Task = std::function<void()>;

  EventLoopThread() = default;

  // Joins the worker. Tasks still queued are discarded.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Starts the worker thread. Idempotent.
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Signals the worker to exit after its current task and joins it.
  // start() may be called again afterwards. Idempotent.
  // Must not be called from a task (the worker cannot join itself).
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // post(task)
  // -------------------------------------------------------------------------
  // What: Enqueues one task. The worker runs it after every task posted
  // before it. Safe from any thread, including from inside a task.
  // -------------------------------------------------------------------------
  void post(Task task) { queue_.push(std::move(task)); }

  bool isRunning() const { return running_.load(); }

  // True when called from the worker thread.
  bool isLoopThread() const {
    return std::this_thread::get_id() == thread_.get_id();
  }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  // Worker loop: try_pop, run, else wait briefly and re-check running_.
  void run();

  ThreadSafeQueue<Task> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};

  // Wakes the worker from its idle wait when stop() is called.
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::thread thread_;
};

}  // namespace relay
