// =============================================================================
// replay_service_test.cpp
// =============================================================================
// Unit tests for relay::ReplayService.
//
// Validates:
//   - No cursor returns the whole buffer
//   - A cursor returns exactly the events with a larger id, in order
//   - A cursor older than the buffer returns what is left (gap visible)
//   - A cursor at or past the newest event returns nothing
//   - Unknown room is NotFound
// =============================================================================

#include "relay/rooms/broadcast_engine.hpp"
#include "relay/rooms/replay_service.hpp"
#include "relay/store/in_memory_state_store.hpp"
#include "relay/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

class ReplayServiceTest : public ::testing::Test {
 protected:
  ReplayServiceTest()
      : registry(store, clock, makeConfig()),
        broadcaster(store, registry, ids, clock, bus),
        replay(store) {}

  static relay::domain::BrokerConfig makeConfig() {
    relay::domain::BrokerConfig config;
    config.max_buffer_size_per_room = 4;
    return config;
  }

  void broadcastN(const std::string& room, int n) {
    for (int i = 0; i < n; ++i) {
      ASSERT_TRUE(
          broadcaster.broadcast(room, relay::EventKind::Offer, "e").ok());
    }
  }

  static std::vector<std::uint64_t> idsOf(
      const std::vector<relay::StreamEvent>& events) {
    std::vector<std::uint64_t> out;
    for (const auto& e : events) out.push_back(e.id);
    return out;
  }

  relay::InMemoryStateStore store;
  relay::SimulationTimeProvider clock;
  relay::EventIdGenerator ids;
  relay::EventBus bus;
  relay::RoomRegistry registry;
  relay::BroadcastEngine broadcaster;
  relay::ReplayService replay;
};

TEST_F(ReplayServiceTest, NoCursorReturnsWholeBuffer) {
  broadcastN("lobby", 3);
  auto events = replay.eventsSince("lobby", std::nullopt);
  ASSERT_TRUE(events.ok());
  EXPECT_EQ(idsOf(events.value()), (std::vector<std::uint64_t>{1, 2, 3}));
}

// -----------------------------------------------------------------------------
// Cursor semantics: strictly greater than the presented id.
// -----------------------------------------------------------------------------
TEST_F(ReplayServiceTest, CursorReturnsOnlyNewerEvents) {
  broadcastN("lobby", 4);
  auto events = replay.eventsSince("lobby", 2u);
  ASSERT_TRUE(events.ok());
  EXPECT_EQ(idsOf(events.value()), (std::vector<std::uint64_t>{3, 4}));
}

// -----------------------------------------------------------------------------
// Ids shared with another room leave gaps in this room's replay; the result
// is still ordered.
// -----------------------------------------------------------------------------
TEST_F(ReplayServiceTest, InterleavedRoomsKeepOrder) {
  broadcastN("a", 1);  // id 1
  broadcastN("b", 1);  // id 2
  broadcastN("a", 1);  // id 3

  auto events = replay.eventsSince("a", 1u);
  ASSERT_TRUE(events.ok());
  EXPECT_EQ(idsOf(events.value()), (std::vector<std::uint64_t>{3}));
}

// -----------------------------------------------------------------------------
// A cursor that fell off the buffer yields the surviving events. The client
// sees the jump from its cursor to the first id and knows it missed some.
// -----------------------------------------------------------------------------
TEST_F(ReplayServiceTest, EvictedCursorReturnsRemainingBuffer) {
  broadcastN("lobby", 8);  // buffer keeps 5..8
  auto events = replay.eventsSince("lobby", 1u);
  ASSERT_TRUE(events.ok());
  EXPECT_EQ(idsOf(events.value()), (std::vector<std::uint64_t>{5, 6, 7, 8}));
}

TEST_F(ReplayServiceTest, CursorAtHeadReturnsNothing) {
  broadcastN("lobby", 2);
  EXPECT_TRUE(replay.eventsSince("lobby", 2u).value().empty());
  EXPECT_TRUE(replay.eventsSince("lobby", 500u).value().empty());
}

TEST_F(ReplayServiceTest, UnknownRoomIsNotFound) {
  auto events = replay.eventsSince("missing", std::nullopt);
  ASSERT_FALSE(events.ok());
  EXPECT_EQ(events.code(), relay::ErrorCode::NotFound);
}
