// =============================================================================
// refresh_scheduler_test.cpp
// =============================================================================
// Unit tests for relay::RefreshScheduler.
//
// Validates the Idle/Refreshing state machine:
//   - ensureRunning() schedules exactly one timer, however often called
//   - A tick with recent activity runs the refresh action
//   - A tick without activity cancels the timer and goes Idle
//   - ensureRunning() after that restarts it
//   - stop() and the destructor cancel the timer
//
// Timers are fired by hand through ManualTimerHost.
// =============================================================================

#include "relay/market/refresh_scheduler.hpp"
#include "relay/timer/manual_timer_host.hpp"

#include <gtest/gtest.h>

#include <string>

using State = relay::RefreshScheduler::State;

class RefreshSchedulerTest : public ::testing::Test {
 protected:
  RefreshSchedulerTest()
      : scheduler(
            timers, 60'000, [this] { return active; },
            [this] { ++refreshes; }) {}

  relay::ManualTimerHost timers;
  bool active{true};
  int refreshes{0};
  relay::RefreshScheduler scheduler;
};

TEST_F(RefreshSchedulerTest, StartsIdleWithNoTimer) {
  EXPECT_EQ(scheduler.state(), State::Idle);
  EXPECT_EQ(timers.activeCount(), 0u);
  EXPECT_STREQ(relay::refreshStateToString(scheduler.state()), "idle");
}

// -----------------------------------------------------------------------------
// Repeated ensureRunning() must not stack timers.
// Why: Every summary read calls ensureRunning(). A second timer would double
//      the upstream load for as long as the broker runs.
// -----------------------------------------------------------------------------
TEST_F(RefreshSchedulerTest, EnsureRunningIsIdempotent) {
  scheduler.ensureRunning();
  scheduler.ensureRunning();
  scheduler.ensureRunning();

  EXPECT_EQ(scheduler.state(), State::Refreshing);
  EXPECT_EQ(timers.activeCount(), 1u);
  EXPECT_STREQ(relay::refreshStateToString(scheduler.state()), "refreshing");
}

TEST_F(RefreshSchedulerTest, TickWithActivityRefreshes) {
  scheduler.ensureRunning();
  timers.fireAll();
  timers.fireAll();

  EXPECT_EQ(refreshes, 2);
  EXPECT_EQ(scheduler.refreshesTriggered(), 2u);
  EXPECT_EQ(scheduler.state(), State::Refreshing);
}

// -----------------------------------------------------------------------------
// Self-cancellation: the first tick that sees no activity stops the timer
// without refreshing.
// -----------------------------------------------------------------------------
TEST_F(RefreshSchedulerTest, TickWithoutActivityGoesIdle) {
  scheduler.ensureRunning();
  timers.fireAll();
  EXPECT_EQ(refreshes, 1);

  active = false;
  timers.fireAll();

  EXPECT_EQ(refreshes, 1);
  EXPECT_EQ(scheduler.state(), State::Idle);
  EXPECT_EQ(timers.activeCount(), 0u);

  // Idle stays idle: nothing left to fire.
  EXPECT_EQ(timers.fireAll(), 0u);
}

TEST_F(RefreshSchedulerTest, RestartsAfterSelfStop) {
  scheduler.ensureRunning();
  active = false;
  timers.fireAll();
  ASSERT_EQ(scheduler.state(), State::Idle);

  active = true;
  scheduler.ensureRunning();
  EXPECT_EQ(scheduler.state(), State::Refreshing);
  EXPECT_EQ(timers.activeCount(), 1u);

  timers.fireAll();
  EXPECT_EQ(refreshes, 1);
}

TEST_F(RefreshSchedulerTest, StopCancelsTimer) {
  scheduler.ensureRunning();
  scheduler.stop();
  EXPECT_EQ(scheduler.state(), State::Idle);
  EXPECT_EQ(timers.activeCount(), 0u);

  scheduler.stop();  // idempotent
  EXPECT_EQ(scheduler.state(), State::Idle);
}

TEST(RefreshSchedulerLifetimeTest, DestructorCancelsTimer) {
  relay::ManualTimerHost timers;
  {
    relay::RefreshScheduler scheduler(
        timers, 1000, [] { return true; }, [] {});
    scheduler.ensureRunning();
    ASSERT_EQ(timers.activeCount(), 1u);
  }
  EXPECT_EQ(timers.activeCount(), 0u);
}
