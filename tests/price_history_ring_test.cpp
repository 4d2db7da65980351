// =============================================================================
// price_history_ring_test.cpp
// =============================================================================
// Unit tests for relay::PriceHistoryRing.
// =============================================================================

#include "relay/market/price_history_ring.hpp"

#include <gtest/gtest.h>

namespace {

relay::domain::PriceSnapshot makeSnapshot(std::int64_t ts, double price) {
  relay::domain::PriceSnapshot snapshot;
  snapshot.timestamp_ms = ts;
  snapshot.prices["AAPL"] = price;
  return snapshot;
}

}  // namespace

TEST(PriceHistoryRingTest, StartsEmpty) {
  relay::PriceHistoryRing ring(4);
  EXPECT_EQ(ring.size(), 0u);
  EXPECT_EQ(ring.capacity(), 4u);
  EXPECT_TRUE(ring.history().empty());
}

TEST(PriceHistoryRingTest, KeepsInsertionOrder) {
  relay::PriceHistoryRing ring(4);
  ring.record(makeSnapshot(10, 1.0));
  ring.record(makeSnapshot(20, 2.0));

  auto history = ring.history();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].timestamp_ms, 10);
  EXPECT_EQ(history[1].timestamp_ms, 20);
  EXPECT_DOUBLE_EQ(history[1].prices.at("AAPL"), 2.0);
}

// -----------------------------------------------------------------------------
// capacity + 5 records: the 5 oldest are gone, the newest is last.
// -----------------------------------------------------------------------------
TEST(PriceHistoryRingTest, EvictsOldestBeyondCapacity) {
  constexpr std::size_t kCapacity = 144;
  relay::PriceHistoryRing ring(kCapacity);

  for (std::size_t i = 0; i < kCapacity + 5; ++i) {
    ring.record(makeSnapshot(static_cast<std::int64_t>(i), 100.0 + i));
  }

  auto history = ring.history();
  ASSERT_EQ(history.size(), kCapacity);
  EXPECT_EQ(history.front().timestamp_ms, 5);
  EXPECT_EQ(history.back().timestamp_ms,
            static_cast<std::int64_t>(kCapacity + 4));
}

TEST(PriceHistoryRingTest, HistoryIsACopy) {
  relay::PriceHistoryRing ring(2);
  ring.record(makeSnapshot(1, 1.0));
  auto history = ring.history();
  history.clear();
  EXPECT_EQ(ring.size(), 1u);
}
