// =============================================================================
// broker_engine_test.cpp
// =============================================================================
// Integration tests for relay::BrokerEngine driven through its JSON command
// interface (the same path IpcServer uses).
//
// Validates:
//   - Lifecycle: start() / stop() idempotent, commands rejected when stopped
//   - Malformed and unknown commands are InvalidInput
//   - Signaling rooms: credentials required, peer-joined / peer-left
//     announcements, broadcast ids and targets, replay by cursor
//   - Admission limit surfaces as a retryable error
//   - Stock rooms: anonymous subscribe, fetch-through with broadcast
//   - Summary: NotFound until refreshed, then served; price history and
//     the refresh scheduler follow
//   - Maintenance: the sweep removes timed-out connections
//   - Command deadlines scale with the fetches a command issues
//
// Design: IPC endpoints are empty so no sockets are bound; the built-in
// mock provider answers synchronously. Time is a SimulationTimeProvider.
// =============================================================================

#include "relay/engine/broker_engine.hpp"
#include "relay/time/simulation_time_provider.hpp"
#include "relay/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

using nlohmann::json;

class BrokerEngineTest : public ::testing::Test {
 protected:
  BrokerEngineTest() : clock(relay::days(100)), engine(makeConfig(), clock) {
    engine.eventBus().subscribe<relay::EventBroadcast>(
        [this](const relay::EventBroadcast& e) {
          std::lock_guard lock(mutex);
          broadcasts.push_back(e);
        });
  }

  void SetUp() override { engine.start(); }
  void TearDown() override { engine.stop(); }

  static relay::domain::BrokerConfig makeConfig() {
    relay::domain::BrokerConfig config;
    config.max_connections_per_room = 2;
    config.access_tokens = {{"tok-a", "alice"}, {"tok-b", "bob"},
                            {"tok-c", "carol"}};
    config.tracked_symbols = {"TCS", "INFY", "WIPRO"};
    config.command_endpoint.clear();
    config.stream_endpoint.clear();
    config.provider_endpoint.clear();
    return config;
  }

  json run(const json& cmd) {
    return json::parse(engine.executeCommand(cmd.dump()));
  }

  std::vector<relay::EventBroadcast> broadcastsSnapshot() {
    std::lock_guard lock(mutex);
    return broadcasts;
  }

  relay::SimulationTimeProvider clock;
  relay::BrokerEngine engine;
  std::mutex mutex;  // broadcasts is written on the request loop
  std::vector<relay::EventBroadcast> broadcasts;
};

// -----------------------------------------------------------------------------
// 1. Lifecycle and basic dispatch.
// -----------------------------------------------------------------------------
TEST_F(BrokerEngineTest, PingAndIdempotentLifecycle) {
  engine.start();
  EXPECT_TRUE(engine.isRunning());

  json reply = run({{"cmd", "ping"}});
  EXPECT_EQ(reply.at("status"), "ok");
  EXPECT_EQ(reply.at("response"), "pong");

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.isRunning());

  json rejected = run({{"cmd", "ping"}});
  EXPECT_EQ(rejected.at("status"), "error");
  EXPECT_EQ(rejected.at("code"), "invalid_input");
}

TEST_F(BrokerEngineTest, MalformedCommandsAreInvalidInput) {
  json garbage = json::parse(engine.executeCommand("{not json"));
  EXPECT_EQ(garbage.at("code"), "invalid_input");

  EXPECT_EQ(run(json::array({1, 2})).at("code"), "invalid_input");
  EXPECT_EQ(run({{"cmd", "teleport"}}).at("code"), "invalid_input");
  EXPECT_EQ(run({{"cmd", "subscribe"}, {"room", "lobby"}}).at("code"),
            "invalid_input");
  EXPECT_EQ(run({{"cmd", "touch"}, {"connection_id", 5}}).at("code"),
            "invalid_input");
  EXPECT_EQ(run({{"cmd", "broadcast"},
                 {"room", "lobby"},
                 {"event", "telepathy"}})
                .at("code"),
            "invalid_input");
}

// -----------------------------------------------------------------------------
// 2. Signaling room: identity, announcements, broadcast and replay.
// -----------------------------------------------------------------------------
TEST_F(BrokerEngineTest, SignalingRoomFlow) {
  json anonymous =
      run({{"cmd", "subscribe"}, {"room", "call-1"}, {"connection_id", "c0"}});
  EXPECT_EQ(anonymous.at("code"), "unauthorized");

  json bad_token = run({{"cmd", "subscribe"},
                        {"room", "call-1"},
                        {"connection_id", "c0"},
                        {"credential", "forged"}});
  EXPECT_EQ(bad_token.at("code"), "unauthorized");

  json alice = run({{"cmd", "subscribe"},
                    {"room", "call-1"},
                    {"connection_id", "c1"},
                    {"credential", "tok-a"}});
  ASSERT_EQ(alice.at("status"), "ok");
  EXPECT_EQ(alice.at("peer_id"), "alice");
  EXPECT_TRUE(alice.at("events").empty());

  // Bob replays Alice's join (id 1) and announces himself (id 2).
  json bob = run({{"cmd", "subscribe"},
                  {"room", "call-1"},
                  {"connection_id", "c2"},
                  {"credential", "tok-b"}});
  ASSERT_EQ(bob.at("status"), "ok");
  ASSERT_EQ(bob.at("events").size(), 1u);
  EXPECT_EQ(bob.at("events")[0].at("id"), 1);
  EXPECT_EQ(bob.at("events")[0].at("event"), "peer-joined");
  EXPECT_EQ(json::parse(bob.at("events")[0].at("data").get<std::string>())
                .at("peerId"),
            "alice");
  EXPECT_EQ(bob.at("stream").get<std::string>().rfind("retry: 3000\n\n", 0),
            0u);

  json offer = run({{"cmd", "broadcast"},
                    {"room", "call-1"},
                    {"event", "offer"},
                    {"payload", {{"from", "alice"}, {"to", "bob"}}}});
  ASSERT_EQ(offer.at("status"), "ok");
  EXPECT_EQ(offer.at("event_id"), 3);
  EXPECT_EQ(offer.at("targets"), json::array({"c1", "c2"}));

  json replay = run(
      {{"cmd", "replay"}, {"room", "call-1"}, {"last_event_id", "1"}});
  ASSERT_EQ(replay.at("status"), "ok");
  ASSERT_EQ(replay.at("events").size(), 2u);
  EXPECT_EQ(replay.at("events")[0].at("event"), "peer-joined");
  EXPECT_EQ(replay.at("events")[1].at("event"), "offer");

  // Malformed cursor replays everything.
  json full = run(
      {{"cmd", "replay"}, {"room", "call-1"}, {"last_event_id", "x17"}});
  EXPECT_EQ(full.at("events").size(), 3u);

  json left = run({{"cmd", "unsubscribe"}, {"connection_id", "c1"}});
  ASSERT_EQ(left.at("status"), "ok");
  auto seen = broadcastsSnapshot();
  ASSERT_FALSE(seen.empty());
  EXPECT_EQ(seen.back().event.kind, relay::EventKind::PeerLeft);
  EXPECT_EQ(seen.back().targets, std::vector<std::string>{"c2"});

  json stats = run({{"cmd", "room_stats"}, {"room", "call-1"}});
  EXPECT_EQ(stats.at("connections"), 1);
  EXPECT_EQ(stats.at("buffered_events"), 4);

  EXPECT_EQ(run({{"cmd", "unsubscribe"}, {"connection_id", "c1"}}).at("code"),
            "not_found");
  EXPECT_EQ(run({{"cmd", "replay"}, {"room", "nowhere"}}).at("code"),
            "not_found");
}

// -----------------------------------------------------------------------------
// 3. Admission limit: retryable admission_rejected.
// -----------------------------------------------------------------------------
TEST_F(BrokerEngineTest, FullRoomRejectsAdmission) {
  for (const auto& [conn, token] :
       std::vector<std::pair<std::string, std::string>>{{"c1", "tok-a"},
                                                        {"c2", "tok-b"}}) {
    ASSERT_EQ(run({{"cmd", "subscribe"},
                   {"room", "small"},
                   {"connection_id", conn},
                   {"credential", token}})
                  .at("status"),
              "ok");
  }

  json third = run({{"cmd", "subscribe"},
                    {"room", "small"},
                    {"connection_id", "c3"},
                    {"credential", "tok-c"}});
  EXPECT_EQ(third.at("code"), "admission_rejected");
  EXPECT_EQ(third.at("retryable"), true);
}

// -----------------------------------------------------------------------------
// 4. Stock room: anonymous access and fetch-through broadcast.
// -----------------------------------------------------------------------------
TEST_F(BrokerEngineTest, StockSubscribeAndFetch) {
  json sub = run({{"cmd", "subscribe_stock"},
                  {"connection_id", "s1"},
                  {"symbol", "TCS"}});
  ASSERT_EQ(sub.at("status"), "ok");
  EXPECT_EQ(sub.at("room"), "stock_TCS");
  EXPECT_EQ(sub.at("peer_id"), "anon-s1");

  EXPECT_EQ(run({{"cmd", "stock_cached"}, {"symbol", "TCS"}}).at("code"),
            "not_found");

  json stock = run({{"cmd", "stock"}, {"symbol", "TCS"}});
  ASSERT_EQ(stock.at("status"), "ok");
  EXPECT_EQ(stock.at("stock").at("symbol"), "TCS");
  EXPECT_EQ(stock.at("stock").at("price_history").size(), 7u);

  auto seen = broadcastsSnapshot();
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].room_id, "stock_TCS");
  EXPECT_EQ(seen[0].targets, std::vector<std::string>{"s1"});

  json cached = run({{"cmd", "stock_cached"}, {"symbol", "TCS"}});
  EXPECT_EQ(cached.at("status"), "ok");

  json news = run({{"cmd", "stock_news"},
                   {"symbol", "TCS"},
                   {"news", json::array({"Quarterly results out"})}});
  EXPECT_EQ(news.at("targets"), 1);

  json stats = run({{"cmd", "stats"}});
  EXPECT_EQ(stats.at("cache_entries"), 1);
  EXPECT_EQ(stats.at("stock_subscriptions"), 1);
  EXPECT_EQ(stats.at("connections"), 1);

  ASSERT_EQ(run({{"cmd", "unsubscribe_stock"}, {"connection_id", "s1"}})
                .at("status"),
            "ok");
  EXPECT_EQ(run({{"cmd", "stats"}}).at("stock_subscriptions"), 0);
}

// -----------------------------------------------------------------------------
// 5. Market summary and the refresh scheduler.
// -----------------------------------------------------------------------------
TEST_F(BrokerEngineTest, SummaryRefreshAndScheduler) {
  EXPECT_EQ(run({{"cmd", "summary"}}).at("code"), "not_found");

  json refreshed = run({{"cmd", "summary_refresh"}});
  ASSERT_EQ(refreshed.at("status"), "ok");
  EXPECT_EQ(refreshed.at("stocks").size(), 3u);
  EXPECT_TRUE(refreshed.at("stocks").contains("INFY"));

  json summary = run({{"cmd", "summary"}});
  ASSERT_EQ(summary.at("status"), "ok");
  EXPECT_EQ(summary.at("cached_at"), clock.now_ms());

  auto seen = broadcastsSnapshot();
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].room_id, "market_global");
  EXPECT_EQ(seen[0].event.kind, relay::EventKind::MarketSummary);

  json scheduler = run({{"cmd", "scheduler"}});
  EXPECT_EQ(scheduler.at("state"), "refreshing");

  json stopped = run({{"cmd", "scheduler"}, {"action", "stop"}});
  EXPECT_EQ(stopped.at("state"), "idle");

  // A forced refresh runs even with a fresh cache, and restarts the
  // background refresh.
  clock.advance_by(relay::minutes(1));
  ASSERT_EQ(run({{"cmd", "summary_refresh"}, {"force", true}}).at("status"),
            "ok");
  EXPECT_EQ(run({{"cmd", "scheduler"}}).at("state"), "refreshing");
  EXPECT_EQ(broadcastsSnapshot().size(), 2u);
}

// -----------------------------------------------------------------------------
// 5b. Price history is sampled on its own, not by the summary.
// Why: The ring holds a day of fixed-interval samples. A summary refresh
//      happens only while someone reads the summary and must not add to it.
// -----------------------------------------------------------------------------
TEST_F(BrokerEngineTest, PriceSnapshotsFeedHistory) {
  ASSERT_EQ(run({{"cmd", "summary_refresh"}}).at("status"), "ok");
  json history = run({{"cmd", "price_history"}});
  EXPECT_EQ(history.at("snapshots").size(), 0u);
  EXPECT_EQ(history.at("capacity"), 144);

  json tracked = run({{"cmd", "price_snapshot"}});
  ASSERT_EQ(tracked.at("status"), "ok");
  EXPECT_EQ(tracked.at("prices").size(), 3u);
  EXPECT_EQ(tracked.at("timestamp"), clock.now_ms());
  EXPECT_EQ(tracked.at("history_length"), 1);

  clock.advance_by(relay::minutes(10));
  json chosen = run({{"cmd", "price_snapshot"},
                     {"symbols", json::array({"TCS", "HDFC", "TCS"})}});
  ASSERT_EQ(chosen.at("status"), "ok");
  EXPECT_EQ(chosen.at("prices").size(), 2u);
  EXPECT_TRUE(chosen.at("prices").contains("HDFC"));
  EXPECT_EQ(chosen.at("history_length"), 2);

  history = run({{"cmd", "price_history"}});
  ASSERT_EQ(history.at("snapshots").size(), 2u);
  EXPECT_TRUE(history.at("snapshots")[0].at("prices").contains("WIPRO"));
  EXPECT_EQ(history.at("snapshots")[1].at("timestamp"), clock.now_ms());

  EXPECT_EQ(run({{"cmd", "price_snapshot"}, {"symbols", json::array()}})
                .at("code"),
            "invalid_input");
  EXPECT_EQ(run({{"cmd", "price_snapshot"}, {"symbols", "TCS"}}).at("code"),
            "invalid_input");
}

// -----------------------------------------------------------------------------
// 5c. A plain subscribe to a stock room is a stock subscription.
// -----------------------------------------------------------------------------
TEST_F(BrokerEngineTest, GenericSubscribeToStockRoomUsesStockPath) {
  json joined = run({{"cmd", "subscribe"},
                     {"room", "stock_TCS"},
                     {"connection_id", "viewer"}});
  ASSERT_EQ(joined.at("status"), "ok");
  EXPECT_EQ(joined.at("peer_id"), "anon-viewer");

  EXPECT_EQ(run({{"cmd", "stats"}}).at("stock_subscriptions"), 1);

  // Stock rooms keep stock_room_buffer_size (100) events, not 1000.
  for (int i = 0; i < 105; ++i) {
    ASSERT_EQ(run({{"cmd", "broadcast"},
                   {"room", "stock_TCS"},
                   {"event", "price-update"},
                   {"payload", "{}"}})
                  .at("status"),
              "ok");
  }
  EXPECT_EQ(run({{"cmd", "room_stats"}, {"room", "stock_TCS"}})
                .at("buffered_events"),
            100);
}

// -----------------------------------------------------------------------------
// 6. Maintenance removes silent connections; touch keeps them.
// -----------------------------------------------------------------------------
TEST_F(BrokerEngineTest, SweepRemovesTimedOutConnections) {
  ASSERT_EQ(run({{"cmd", "subscribe_stock"},
                 {"connection_id", "quiet"},
                 {"symbol", "INFY"}})
                .at("status"),
            "ok");
  ASSERT_EQ(run({{"cmd", "subscribe_stock"},
                 {"connection_id", "chatty"},
                 {"symbol", "INFY"}})
                .at("status"),
            "ok");

  clock.advance_by(relay::minutes(4));
  ASSERT_EQ(run({{"cmd", "touch"}, {"connection_id", "chatty"}}).at("status"),
            "ok");
  clock.advance_by(relay::minutes(2));

  json sweep = run({{"cmd", "sweep"}});
  ASSERT_EQ(sweep.at("status"), "ok");
  EXPECT_EQ(sweep.at("connections_removed"), 1);
  EXPECT_EQ(sweep.at("subscriptions_removed"), 1);

  json stats = run({{"cmd", "stats"}});
  EXPECT_EQ(stats.at("connections"), 1);
  EXPECT_EQ(run({{"cmd", "touch"}, {"connection_id", "quiet"}}).at("code"),
            "not_found");
}

// -----------------------------------------------------------------------------
// 7. The command wait grows with the number of provider fetches.
// -----------------------------------------------------------------------------
// Why: the ZMQ provider answers one request at a time, so a refresh over N
// symbols can legitimately take N provider timeouts.
TEST_F(BrokerEngineTest, CommandDeadlineCoversSequentialFetches) {
  using std::chrono::milliseconds;
  const std::int64_t timeout = relay::domain::BrokerConfig{}.provider_timeout_ms;

  EXPECT_EQ(engine.commandDeadline(json{{"cmd", "ping"}}.dump()),
            milliseconds(2 * timeout + 5000));
  // Three tracked symbols.
  EXPECT_EQ(engine.commandDeadline(json{{"cmd", "summary_refresh"}}.dump()),
            milliseconds(4 * timeout + 5000));
  EXPECT_EQ(engine.commandDeadline(
                json{{"cmd", "price_snapshot"},
                     {"symbols", {"A", "B", "C", "D", "E"}}}
                    .dump()),
            milliseconds(6 * timeout + 5000));
  EXPECT_EQ(engine.commandDeadline(json{{"cmd", "price_snapshot"}}.dump()),
            milliseconds(4 * timeout + 5000));
  EXPECT_EQ(engine.commandDeadline("{not json"),
            milliseconds(2 * timeout + 5000));
}
