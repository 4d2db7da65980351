#pragma once

#include "relay/cache/cache_entry_manager.hpp"
#include "relay/cache/i_data_provider.hpp"
#include "relay/concurrent/event_id_generator.hpp"
#include "relay/concurrent/event_loop_thread.hpp"
#include "relay/concurrent/loop_timer_host.hpp"
#include "relay/domain/broker_config.hpp"
#include "relay/identity/i_identity_verifier.hpp"
#include "relay/market/market_summary_service.hpp"
#include "relay/market/price_history_ring.hpp"
#include "relay/market/price_snapshot_service.hpp"
#include "relay/market/stock_stream_service.hpp"
#include "relay/network/ipc_server.hpp"
#include "relay/rooms/broadcast_engine.hpp"
#include "relay/rooms/cleanup_sweep.hpp"
#include "relay/rooms/replay_service.hpp"
#include "relay/rooms/room_registry.hpp"
#include "relay/store/i_state_store.hpp"
#include "relay/time/i_time_provider.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace relay {

class ZmqDataProvider;

// Result of one maintenance tick.
struct MaintenanceReport {
  SweepReport sweep;
  std::size_t cache_entries_purged{0};
};

// -----------------------------------------------------------------------------
// BrokerEngine: owns and wires every broker component
// -----------------------------------------------------------------------------
//
// @brief  Top-level object of the relay_broker executable. Owns the request
//         loop, the timer host, the state store, all core components, the
//         data provider and the optional IPC server.
//
// @details
// Component graph (all owned here, all living on the request loop):
//
//   EventIdGenerator ─┐
//   IStateStore ──────┼─> RoomRegistry ─> BroadcastEngine ─┐
//                     ├─> ReplayService                    ├─> StockStreamService
//                     ├─> CleanupSweep                     │
//   IDataProvider ────┴─> CacheEntryManager ───────────────┘
//                     ├─> MarketSummaryService (SummaryCache + RefreshScheduler)
//                     └─> PriceSnapshotService ─> PriceHistoryRing
//
// Commands:
//   JSON documents {"cmd": "<name>", ...}. submit() posts the command onto
//   the loop and returns a future for the JSON reply. Handlers that need
//   the provider reply from the completion task, after the suspension
//   point. executeCommand() is the blocking form used by IpcServer.
//
//   Reply: {"status":"ok", ...} or
//          {"status":"error","code":"<error code>","message":..,"retryable":..}
//
// Wiring done by start():
//   - EventBroadcast on the loop bus → one [connection_id, frame] message
//     per target on the IPC server's PUB socket.
//   - Maintenance timer every cleanup_interval_ms: CleanupSweep::run() plus
//     CacheEntryManager::purgeExpired(), then SweepCompleted.
//   - Price sampling every price_snapshot_interval_ms: one PriceSnapshot of
//     the tracked symbols into the PriceHistoryRing.
//   - After a successful summary refresh: market-summary broadcast to the
//     market room, SummaryRefreshed on the bus.
//
// Lifecycle:
//   start(): loop → timer host → provider worker → maintenance and
//            sampling timers → IPC.
//   stop():  IPC → timer host → provider worker → (on the loop) scheduler
//            stop and timer cancel → loop. Both idempotent.
//
// Thread model:
//   Public methods may be called from any thread except the loop itself
//   (executeCommand() would deadlock there and reports an error instead).
//
// Ownership:
//   Holds a reference to the time provider, which must outlive the engine.
// -----------------------------------------------------------------------------
class BrokerEngine {
 public:
  using Reply = std::function<void(nlohmann::json)>;

  // provider == nullptr selects ZmqDataProvider when config.provider_endpoint
  // is set, MockDataProvider otherwise.
  BrokerEngine(domain::BrokerConfig config,
               const ITimeProvider& time_provider,
               std::unique_ptr<IDataProvider> provider = nullptr);

  ~BrokerEngine();

  BrokerEngine(const BrokerEngine&) = delete;
  BrokerEngine& operator=(const BrokerEngine&) = delete;
  BrokerEngine(BrokerEngine&&) = delete;
  BrokerEngine& operator=(BrokerEngine&&) = delete;

  void start();
  void stop();
  bool isRunning() const { return running_; }

  // -------------------------------------------------------------------------
  // submit(cmd)
  // -------------------------------------------------------------------------
  // @brief  Posts one JSON command onto the loop.
  // @return Future for the serialised JSON reply. If the engine is not
  //         running the future is already satisfied with an error reply.
  // -------------------------------------------------------------------------
  std::future<std::string> submit(const std::string& cmd);

  // Blocking submit(). Gives up after commandDeadline(cmd).
  std::string executeCommand(const std::string& cmd);

  // -------------------------------------------------------------------------
  // commandDeadline(cmd)
  // -------------------------------------------------------------------------
  // How long executeCommand() waits for `cmd`. ZmqDataProvider answers one
  // request at a time, so the wait covers one provider timeout per fetch the
  // command may issue, plus one for a request already on the wire, plus a
  // fixed margin. Malformed text gets the single-fetch deadline.
  // -------------------------------------------------------------------------
  std::chrono::milliseconds commandDeadline(const std::string& cmd) const;

  // Runs `task` on the request loop.
  void post(EventLoopThread::Task task) { loop_.post(std::move(task)); }

  // Notification bus of the request loop. Subscribers run on the loop.
  EventBus& eventBus() { return loop_.eventBus(); }

  const domain::BrokerConfig& config() const { return config_; }

 private:
  // --- Wiring (broker_engine.cpp) -------------------------------------------
  void onEventBroadcast(const EventBroadcast& broadcast);
  void onSummaryRefreshed(const CachedSummary& summary, std::size_t failed);
  MaintenanceReport runMaintenance();

  // --- Commands (broker_commands.cpp) ---------------------------------------
  void dispatch(const std::string& raw, Reply reply);
  void handleSubscribe(const nlohmann::json& cmd, Reply& reply);
  void handleUnsubscribe(const nlohmann::json& cmd, Reply& reply);
  void handleTouch(const nlohmann::json& cmd, Reply& reply);
  void handleBroadcast(const nlohmann::json& cmd, Reply& reply);
  void handleReplay(const nlohmann::json& cmd, Reply& reply);
  void handleRoomStats(const nlohmann::json& cmd, Reply& reply);
  void handleStats(Reply& reply);
  void handleStock(const nlohmann::json& cmd, Reply& reply);
  void handleStockCached(const nlohmann::json& cmd, Reply& reply);
  void handleStockNews(const nlohmann::json& cmd, Reply& reply);
  void handleSubscribeStock(const nlohmann::json& cmd, Reply& reply);
  void handleUnsubscribeStock(const nlohmann::json& cmd, Reply& reply);
  void handleSummary(Reply& reply);
  void handleSummaryRefresh(const nlohmann::json& cmd, Reply& reply);
  void handlePriceHistory(Reply& reply);
  void handlePriceSnapshot(const nlohmann::json& cmd, Reply& reply);
  void handleSweep(Reply& reply);
  void handleScheduler(const nlohmann::json& cmd, Reply& reply);

  // Identity for a room: anonymous allowed in public rooms only.
  Result<std::string> resolvePeer(const std::string& room_id,
                                  const std::string& connection_id,
                                  const nlohmann::json& cmd) const;

  domain::BrokerConfig config_;
  const ITimeProvider& time_provider_;

  EventLoopThread loop_;
  LoopTimerHost timer_host_;

  EventIdGenerator event_ids_;
  std::unique_ptr<IStateStore> store_;
  std::unique_ptr<IIdentityVerifier> verifier_;
  std::unique_ptr<IDataProvider> provider_;
  ZmqDataProvider* zmq_provider_{nullptr};  // Non-owning view of provider_

  std::unique_ptr<RoomRegistry> registry_;
  std::unique_ptr<BroadcastEngine> broadcaster_;
  std::unique_ptr<ReplayService> replay_;
  std::unique_ptr<CleanupSweep> sweep_;
  std::unique_ptr<CacheEntryManager> cache_;
  std::unique_ptr<StockStreamService> stocks_;
  std::unique_ptr<MarketSummaryService> summary_;
  std::unique_ptr<PriceHistoryRing> price_history_;
  std::unique_ptr<PriceSnapshotService> snapshots_;

  std::unique_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId broadcast_sub_id_{0};
  EventBus::SubscriptionId closed_sub_id_{0};
  ITimerHost::TimerId maintenance_timer_{0};

  bool running_{false};
};

}  // namespace relay
