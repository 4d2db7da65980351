#include "relay/engine/broker_engine.hpp"

#include "relay/cache/mock_data_provider.hpp"
#include "relay/cache/zmq_data_provider.hpp"
#include "relay/identity/token_identity_verifier.hpp"
#include "relay/store/in_memory_state_store.hpp"
#include "relay/transport/sse_format.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace relay {

// -----------------------------------------------------------------------------
// Constructor: build the component graph; no threads yet
// -----------------------------------------------------------------------------
BrokerEngine::BrokerEngine(domain::BrokerConfig config,
                           const ITimeProvider& time_provider,
                           std::unique_ptr<IDataProvider> provider)
    : config_(std::move(config)),
      time_provider_(time_provider),
      timer_host_(loop_),
      store_(std::make_unique<InMemoryStateStore>()),
      verifier_(std::make_unique<TokenIdentityVerifier>(config_.access_tokens)),
      provider_(std::move(provider)) {
  if (!provider_) {
    if (!config_.provider_endpoint.empty()) {
      auto zmq_provider = std::make_unique<ZmqDataProvider>(
          config_.provider_endpoint, config_.provider_timeout_ms,
          [this](std::function<void()> completion) {
            loop_.post(std::move(completion));
          });
      zmq_provider_ = zmq_provider.get();
      provider_ = std::move(zmq_provider);
    } else {
      provider_ = std::make_unique<MockDataProvider>(time_provider_);
    }
  }

  registry_ =
      std::make_unique<RoomRegistry>(*store_, time_provider_, config_);
  broadcaster_ = std::make_unique<BroadcastEngine>(
      *store_, *registry_, event_ids_, time_provider_, loop_.eventBus());
  replay_ = std::make_unique<ReplayService>(*store_);
  sweep_ = std::make_unique<CleanupSweep>(*store_, *registry_, time_provider_,
                                          loop_.eventBus(), config_);
  cache_ = std::make_unique<CacheEntryManager>(
      *store_, *provider_, time_provider_, CachePolicy::fromConfig(config_));
  stocks_ = std::make_unique<StockStreamService>(
      *store_, *registry_, *broadcaster_, *replay_, *cache_, time_provider_,
      config_);
  summary_ = std::make_unique<MarketSummaryService>(
      *provider_, time_provider_, timer_host_, config_);
  price_history_ =
      std::make_unique<PriceHistoryRing>(config_.price_history_capacity);
  snapshots_ = std::make_unique<PriceSnapshotService>(
      *provider_, time_provider_, timer_host_, *price_history_);

  summary_->setOnRefreshed(
      [this](const CachedSummary& summary, std::size_t failed) {
        onSummaryRefreshed(summary, failed);
      });
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
BrokerEngine::~BrokerEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void BrokerEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Bus subscribers before anything can publish --------------------
  broadcast_sub_id_ = loop_.eventBus().subscribe<EventBroadcast>(
      [this](const EventBroadcast& e) { onEventBroadcast(e); });
  closed_sub_id_ = loop_.eventBus().subscribe<ConnectionClosed>(
      [](const ConnectionClosed& e) {
        std::cout << "[BrokerEngine] connection closed id=" << e.connection_id
                  << " room=" << e.room_id << " reason=" << e.reason
                  << std::endl;
      });

  // ---  2) Request loop and timers ------------------------------------------
  loop_.start();
  timer_host_.start();

  // ---  3) Provider worker --------------------------------------------------
  if (zmq_provider_ != nullptr) {
    zmq_provider_->start();
  }

  // ---  4) Maintenance tick and price sampling --------------------------------
  // Both timers are loop state; schedule them from the loop.
  std::promise<void> scheduled;
  std::future<void> scheduled_future = scheduled.get_future();
  loop_.post([this, &scheduled] {
    maintenance_timer_ = timer_host_.scheduleEvery(
        config_.cleanup_interval_ms, [this] { runMaintenance(); });
    if (!config_.tracked_symbols.empty()) {
      snapshots_->startPeriodic(config_.price_snapshot_interval_ms,
                                config_.tracked_symbols);
    }
    scheduled.set_value();
  });
  scheduled_future.wait();

  // ---  5) IPC server last: commands may arrive as soon as it binds ---------
  if (!config_.command_endpoint.empty() && !config_.stream_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.stream_endpoint);
    ipc_server_->start();
  }

  running_ = true;

  std::cout << "[BrokerEngine] started. provider="
            << (zmq_provider_ ? config_.provider_endpoint : "mock")
            << " ipc=" << (ipc_server_ ? "on" : "off") << std::endl;
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void BrokerEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new commands ----------------------------------------------------
  ipc_server_.reset();

  // ---  2) No new ticks -------------------------------------------------------
  timer_host_.stop();

  // ---  3) Provider worker: pending fetches fail onto the loop ----------------
  if (zmq_provider_ != nullptr) {
    zmq_provider_->stop();
  }

  // ---  4) Scheduler and maintenance timer are loop state ---------------------
  std::promise<void> drained;
  std::future<void> drained_future = drained.get_future();
  loop_.post([this, &drained] {
    summary_->stop();
    snapshots_->stopPeriodic();
    timer_host_.cancel(maintenance_timer_);
    maintenance_timer_ = 0;
    drained.set_value();
  });
  drained_future.wait();

  // ---  5) Loop last ----------------------------------------------------------
  loop_.stop();

  loop_.eventBus().unsubscribe(broadcast_sub_id_);
  loop_.eventBus().unsubscribe(closed_sub_id_);

  running_ = false;
  std::cout << "[BrokerEngine] stopped. All threads joined." << std::endl;
}

// -----------------------------------------------------------------------------
// submit(): post one command and hand back its future reply
// -----------------------------------------------------------------------------
std::future<std::string> BrokerEngine::submit(const std::string& cmd) {
  auto promise = std::make_shared<std::promise<std::string>>();
  std::future<std::string> future = promise->get_future();

  if (!running_) {
    nlohmann::json reply;
    reply["status"] = "error";
    reply["code"] = errorCodeToString(ErrorCode::InvalidInput);
    reply["message"] = "engine not running";
    reply["retryable"] = false;
    promise->set_value(reply.dump());
    return future;
  }

  loop_.post([this, cmd, promise] {
    dispatch(cmd, [promise](nlohmann::json reply) {
      promise->set_value(reply.dump());
    });
  });
  return future;
}

// -----------------------------------------------------------------------------
// executeCommand(): blocking form for IpcServer
// -----------------------------------------------------------------------------
std::string BrokerEngine::executeCommand(const std::string& cmd) {
  nlohmann::json failure;
  failure["status"] = "error";
  failure["retryable"] = true;

  if (loop_.isLoopThread()) {
    failure["code"] = errorCodeToString(ErrorCode::InvalidInput);
    failure["message"] = "executeCommand called from the request loop";
    failure["retryable"] = false;
    return failure.dump();
  }

  std::future<std::string> reply = submit(cmd);
  if (reply.wait_for(commandDeadline(cmd)) != std::future_status::ready) {
    failure["code"] = errorCodeToString(ErrorCode::ProviderFailure);
    failure["message"] = "command timed out";
    return failure.dump();
  }
  return reply.get();
}

// -----------------------------------------------------------------------------
// onEventBroadcast(): fan out to the stream socket (loop thread)
// -----------------------------------------------------------------------------
void BrokerEngine::onEventBroadcast(const EventBroadcast& broadcast) {
  if (!ipc_server_ || broadcast.targets.empty()) {
    return;
  }
  const std::string frame = formatEvent(broadcast.event);
  for (const auto& connection_id : broadcast.targets) {
    ipc_server_->pushFrame(OutboundFrame{connection_id, frame});
  }
}

// -----------------------------------------------------------------------------
// onSummaryRefreshed(): broadcast and announce
// -----------------------------------------------------------------------------
void BrokerEngine::onSummaryRefreshed(const CachedSummary& summary,
                                      std::size_t failed) {
  auto sent = stocks_->broadcastMarketSummary(summary.data);
  if (!sent.ok()) {
    std::cerr << "[BrokerEngine] market summary broadcast failed: "
              << sent.error().message << std::endl;
  }

  loop_.eventBus().publish(
      SummaryRefreshed{summary.data.size(), failed, summary.cached_at_ms});
}

// -----------------------------------------------------------------------------
// runMaintenance(): cleanup sweep + cache purge (loop thread)
// -----------------------------------------------------------------------------
MaintenanceReport BrokerEngine::runMaintenance() {
  MaintenanceReport report;
  report.sweep = sweep_->run();
  report.cache_entries_purged = cache_->purgeExpired();

  loop_.eventBus().publish(SweepCompleted{
      report.sweep.connections_removed, report.sweep.rooms_removed,
      report.sweep.events_expired, report.cache_entries_purged});
  return report;
}

}  // namespace relay
