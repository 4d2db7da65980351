// =============================================================================
// stock_stream_service_test.cpp
// =============================================================================
// Unit tests for relay::StockStreamService.
//
// Validates:
//   - Room naming and which rooms are public
//   - subscribeToStock() admits with the stock buffer bound, records the
//     subscription and replays from the cursor
//   - unsubscribeFromStock() removes both records; NotFound when neither
//     existed
//   - Price, news and market-summary broadcasts carry the documented payloads
//   - getStock() broadcasts a price update only for provider data
// =============================================================================

#include "relay/market/stock_stream_service.hpp"
#include "relay/store/in_memory_state_store.hpp"
#include "relay/time/simulation_time_provider.hpp"
#include "support/scripted_data_provider.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

class StockStreamServiceTest : public ::testing::Test {
 protected:
  StockStreamServiceTest()
      : config(makeConfig()),
        clock(50'000),
        registry(store, clock, config),
        broadcaster(store, registry, ids, clock, bus),
        replay(store),
        cache(store, provider, clock, relay::CachePolicy::fromConfig(config)),
        stocks(store, registry, broadcaster, replay, cache, clock, config) {
    bus.subscribe<relay::EventBroadcast>(
        [this](const relay::EventBroadcast& e) { broadcasts.push_back(e); });
  }

  static relay::domain::BrokerConfig makeConfig() {
    relay::domain::BrokerConfig config;
    config.stock_room_buffer_size = 3;
    config.max_buffer_size_per_room = 50;
    return config;
  }

  relay::domain::BrokerConfig config;
  relay::InMemoryStateStore store;
  relay::SimulationTimeProvider clock;
  relay::EventIdGenerator ids;
  relay::EventBus bus;
  relay::testing::ScriptedDataProvider provider;
  relay::RoomRegistry registry;
  relay::BroadcastEngine broadcaster;
  relay::ReplayService replay;
  relay::CacheEntryManager cache;
  relay::StockStreamService stocks;
  std::vector<relay::EventBroadcast> broadcasts;
};

TEST_F(StockStreamServiceTest, RoomNamingAndVisibility) {
  EXPECT_EQ(stocks.roomFor("AAPL"), "stock_AAPL");
  EXPECT_EQ(stocks.marketRoom(), "market_global");

  EXPECT_TRUE(stocks.isPublicRoom("stock_AAPL"));
  EXPECT_TRUE(stocks.isPublicRoom("market_global"));
  EXPECT_FALSE(stocks.isPublicRoom("stock_"));
  EXPECT_FALSE(stocks.isPublicRoom("lobby"));
  EXPECT_FALSE(stocks.isPublicRoom("stocks_AAPL"));
}

// -----------------------------------------------------------------------------
// Subscribe creates the stock room with the stock buffer bound, not the
// signaling default.
// -----------------------------------------------------------------------------
TEST_F(StockStreamServiceTest, SubscribeUsesStockBufferAndRecordsSubscription) {
  auto events = stocks.subscribeToStock("c1", "anon-c1", "AAPL", std::nullopt);
  ASSERT_TRUE(events.ok());
  EXPECT_TRUE(events.value().empty());

  auto room = store.getRoom("stock_AAPL");
  ASSERT_TRUE(room.has_value());
  EXPECT_EQ(room->max_buffer_size, 3u);

  auto subscription = store.getSubscription("c1");
  ASSERT_TRUE(subscription.has_value());
  EXPECT_EQ(subscription->symbol, "AAPL");
  EXPECT_EQ(subscription->subscribed_at_ms, 50'000);
}

TEST_F(StockStreamServiceTest, SubscribeReplaysFromCursor) {
  relay::domain::Stock stock;
  stock.current_price = 10.0;
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(stocks.broadcastStockUpdate("MSFT", stock).ok());
  }
  // Buffer of 3 keeps ids 3..5.

  auto all = stocks.subscribeToStock("c1", "p", "MSFT", std::nullopt);
  ASSERT_TRUE(all.ok());
  ASSERT_EQ(all.value().size(), 3u);
  EXPECT_EQ(all.value().front().id, 3u);

  auto tail = stocks.subscribeToStock("c2", "p", "MSFT", 4u);
  ASSERT_TRUE(tail.ok());
  ASSERT_EQ(tail.value().size(), 1u);
  EXPECT_EQ(tail.value().front().id, 5u);
}

TEST_F(StockStreamServiceTest, UnsubscribeRemovesBothRecords) {
  ASSERT_TRUE(stocks.subscribeToStock("c1", "p", "TSLA", std::nullopt).ok());
  ASSERT_TRUE(stocks.unsubscribeFromStock("c1").ok());

  EXPECT_FALSE(store.getSubscription("c1").has_value());
  EXPECT_FALSE(registry.connection("c1").has_value());
  EXPECT_EQ(stocks.unsubscribeFromStock("c1").code(),
            relay::ErrorCode::NotFound);
}

// -----------------------------------------------------------------------------
// Payload shapes of the three stock broadcasts.
// -----------------------------------------------------------------------------
TEST_F(StockStreamServiceTest, PriceUpdatePayload) {
  ASSERT_TRUE(stocks.subscribeToStock("c1", "p", "AAPL", std::nullopt).ok());

  relay::domain::Stock stock = relay::generateMockStock("AAPL", clock.now_ms());
  auto sent = stocks.broadcastStockUpdate("AAPL", stock);
  ASSERT_TRUE(sent.ok());
  EXPECT_EQ(sent.value(), 1u);

  ASSERT_EQ(broadcasts.size(), 1u);
  EXPECT_EQ(broadcasts[0].room_id, "stock_AAPL");
  EXPECT_EQ(broadcasts[0].event.kind, relay::EventKind::PriceUpdate);

  auto payload = nlohmann::json::parse(broadcasts[0].event.payload);
  EXPECT_EQ(payload.at("type"), "price_update");
  EXPECT_EQ(payload.at("stock_id"), "AAPL");
  EXPECT_DOUBLE_EQ(payload.at("current_price").get<double>(),
                   stock.current_price);
  EXPECT_EQ(payload.at("price_history").size(), stock.price_history.size());
  EXPECT_TRUE(payload.at("metrics").contains("pe_ratio"));
  EXPECT_EQ(payload.at("timestamp"), 50'000);
}

TEST_F(StockStreamServiceTest, NewsUpdatePayload) {
  auto sent = stocks.broadcastStockNews("INFY", {"headline one", "two"});
  ASSERT_TRUE(sent.ok());
  EXPECT_EQ(sent.value(), 0u);

  ASSERT_EQ(broadcasts.size(), 1u);
  EXPECT_EQ(broadcasts[0].event.kind, relay::EventKind::NewsUpdate);
  auto payload = nlohmann::json::parse(broadcasts[0].event.payload);
  EXPECT_EQ(payload.at("type"), "news_update");
  EXPECT_EQ(payload.at("news").size(), 2u);
}

TEST_F(StockStreamServiceTest, MarketSummaryGoesToMarketRoom) {
  relay::domain::MarketSummary summary;
  summary["AAPL"] = relay::generateMockStock("AAPL", clock.now_ms());
  summary["TCS"] = relay::generateMockStock("TCS", clock.now_ms());

  ASSERT_TRUE(stocks.broadcastMarketSummary(summary).ok());
  ASSERT_EQ(broadcasts.size(), 1u);
  EXPECT_EQ(broadcasts[0].room_id, "market_global");
  EXPECT_EQ(broadcasts[0].event.kind, relay::EventKind::MarketSummary);

  auto payload = nlohmann::json::parse(broadcasts[0].event.payload);
  EXPECT_EQ(payload.at("type"), "market_summary");
  EXPECT_TRUE(payload.at("stocks").contains("TCS"));
  EXPECT_EQ(store.getRoom("market_global")->max_buffer_size, 3u);
}

// -----------------------------------------------------------------------------
// getStock(): provider data is broadcast to the stock room, a cache hit is
// not (subscribers already have it).
// -----------------------------------------------------------------------------
TEST_F(StockStreamServiceTest, GetStockBroadcastsOnlyFreshData) {
  std::optional<relay::Result<relay::domain::Stock>> first;
  stocks.getStock("WIPRO", [&first](relay::Result<relay::domain::Stock> r) {
    first = std::move(r);
  });
  EXPECT_FALSE(first.has_value());
  ASSERT_TRUE(provider.succeed("WIPRO", clock.now_ms(), 381.5));

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(first->ok());
  EXPECT_DOUBLE_EQ(first->value().current_price, 381.5);
  ASSERT_EQ(broadcasts.size(), 1u);
  EXPECT_EQ(broadcasts[0].room_id, "stock_WIPRO");

  std::optional<relay::Result<relay::domain::Stock>> second;
  stocks.getStock("WIPRO", [&second](relay::Result<relay::domain::Stock> r) {
    second = std::move(r);
  });
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(second->ok());
  EXPECT_EQ(broadcasts.size(), 1u);
  EXPECT_EQ(provider.fetchCount(), 1u);

  auto cached = stocks.getCachedStock("WIPRO");
  ASSERT_TRUE(cached.ok());
  EXPECT_DOUBLE_EQ(cached.value().current_price, 381.5);
}

TEST_F(StockStreamServiceTest, GetStockProviderFailureIsReported) {
  std::optional<relay::Result<relay::domain::Stock>> result;
  stocks.getStock("ITC", [&result](relay::Result<relay::domain::Stock> r) {
    result = std::move(r);
  });
  ASSERT_TRUE(provider.fail("ITC"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->code(), relay::ErrorCode::ProviderFailure);
  EXPECT_TRUE(broadcasts.empty());
}
