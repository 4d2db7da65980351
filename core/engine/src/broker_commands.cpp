#include "relay/engine/broker_engine.hpp"

#include "relay/events/payloads.hpp"
#include "relay/identity/token_identity_verifier.hpp"
#include "relay/transport/sse_format.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <utility>

namespace relay {

namespace {

nlohmann::json okReply() {
  nlohmann::json j;
  j["status"] = "ok";
  return j;
}

nlohmann::json errorReply(const Error& error) {
  nlohmann::json j;
  j["status"] = "error";
  j["code"] = errorCodeToString(error.code);
  j["message"] = error.message;
  j["retryable"] = isRetryable(error.code);
  return j;
}

Result<std::string> requireString(const nlohmann::json& cmd, const char* key) {
  auto it = cmd.find(key);
  if (it == cmd.end() || !it->is_string() ||
      it->get_ref<const std::string&>().empty()) {
    return makeError(ErrorCode::InvalidInput,
                     std::string("missing or empty field '") + key + "'");
  }
  return it->get<std::string>();
}

// Last-Event-ID as a number or as header text. Anything unusable means "no
// cursor", never an error.
std::optional<std::uint64_t> cursorField(const nlohmann::json& cmd) {
  auto it = cmd.find("last_event_id");
  if (it == cmd.end()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    return it->get<std::uint64_t>();
  }
  if (it->is_string()) {
    return parseLastEventId(it->get_ref<const std::string&>());
  }
  return std::nullopt;
}

nlohmann::json eventToJson(const StreamEvent& event) {
  nlohmann::json j;
  j["id"] = event.id;
  j["event"] = eventKindToString(event.kind);
  j["data"] = event.payload;
  j["timestamp"] = event.timestamp_ms;
  return j;
}

nlohmann::json eventsToJson(const std::vector<StreamEvent>& events) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& event : events) {
    array.push_back(eventToJson(event));
  }
  return array;
}

}  // namespace

// -----------------------------------------------------------------------------
// dispatch(): parse and route one command (loop thread)
// -----------------------------------------------------------------------------
void BrokerEngine::dispatch(const std::string& raw, Reply reply) {
  nlohmann::json cmd;
  try {
    cmd = nlohmann::json::parse(raw);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[BrokerEngine] malformed command: " << e.what() << std::endl;
    reply(errorReply(makeError(ErrorCode::InvalidInput,
                               std::string("malformed JSON: ") + e.what())));
    return;
  }

  auto name_it = cmd.is_object() ? cmd.find("cmd") : cmd.end();
  if (!cmd.is_object() || name_it == cmd.end() || !name_it->is_string()) {
    std::cerr << "[BrokerEngine] command without 'cmd': " << raw << std::endl;
    reply(errorReply(makeError(ErrorCode::InvalidInput,
                               "command must be an object with 'cmd'")));
    return;
  }
  const std::string name = name_it->get<std::string>();

  // Field extraction may throw type_error on a wrongly typed field. Every
  // handler replies only after its fields are read, so a throw means no
  // reply has been sent yet.
  try {
    if (name == "ping") {
      nlohmann::json r = okReply();
      r["response"] = "pong";
      reply(std::move(r));
    } else if (name == "subscribe") {
      handleSubscribe(cmd, reply);
    } else if (name == "unsubscribe") {
      handleUnsubscribe(cmd, reply);
    } else if (name == "touch") {
      handleTouch(cmd, reply);
    } else if (name == "broadcast") {
      handleBroadcast(cmd, reply);
    } else if (name == "replay") {
      handleReplay(cmd, reply);
    } else if (name == "room_stats") {
      handleRoomStats(cmd, reply);
    } else if (name == "stats") {
      handleStats(reply);
    } else if (name == "stock") {
      handleStock(cmd, reply);
    } else if (name == "stock_cached") {
      handleStockCached(cmd, reply);
    } else if (name == "stock_news") {
      handleStockNews(cmd, reply);
    } else if (name == "subscribe_stock") {
      handleSubscribeStock(cmd, reply);
    } else if (name == "unsubscribe_stock") {
      handleUnsubscribeStock(cmd, reply);
    } else if (name == "summary") {
      handleSummary(reply);
    } else if (name == "summary_refresh") {
      handleSummaryRefresh(cmd, reply);
    } else if (name == "price_history") {
      handlePriceHistory(reply);
    } else if (name == "price_snapshot") {
      handlePriceSnapshot(cmd, reply);
    } else if (name == "sweep") {
      handleSweep(reply);
    } else if (name == "scheduler") {
      handleScheduler(cmd, reply);
    } else {
      reply(errorReply(
          makeError(ErrorCode::InvalidInput, "unknown command: " + name)));
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[BrokerEngine] bad field in '" << name << "': " << e.what()
              << std::endl;
    reply(errorReply(makeError(ErrorCode::InvalidInput,
                               std::string("bad field: ") + e.what())));
  }
}

// -----------------------------------------------------------------------------
// commandDeadline(): executeCommand() wait, sized by the fetches issued
// -----------------------------------------------------------------------------
std::chrono::milliseconds BrokerEngine::commandDeadline(
    const std::string& raw) const {
  constexpr std::int64_t kMarginMs = 5000;

  std::size_t fetches = 1;
  const auto cmd = nlohmann::json::parse(raw, nullptr, false);
  if (cmd.is_object()) {
    const auto name = cmd.find("cmd");
    if (name != cmd.end() && name->is_string()) {
      const auto& text = name->get_ref<const std::string&>();
      if (text == "summary_refresh") {
        fetches = config_.tracked_symbols.size();
      } else if (text == "price_snapshot") {
        const auto symbols = cmd.find("symbols");
        fetches = symbols != cmd.end() && symbols->is_array()
                      ? symbols->size()
                      : config_.tracked_symbols.size();
      }
    }
  }

  // One extra slot for a request already in flight on the provider socket.
  const std::int64_t slots = static_cast<std::int64_t>(fetches) + 1;
  return std::chrono::milliseconds(config_.provider_timeout_ms * slots +
                                   kMarginMs);
}

// -----------------------------------------------------------------------------
// resolvePeer(): credential → peer id, anonymous only in public rooms
// -----------------------------------------------------------------------------
Result<std::string> BrokerEngine::resolvePeer(
    const std::string& room_id, const std::string& connection_id,
    const nlohmann::json& cmd) const {
  const std::string credential = cmd.value("credential", std::string());
  if (!credential.empty()) {
    return verifier_->verifyCaller(credential);
  }
  if (stocks_->isPublicRoom(room_id)) {
    return anonymousPeerId(connection_id);
  }
  return makeError(ErrorCode::Unauthorized,
                   "room " + room_id + " requires a credential");
}

// -----------------------------------------------------------------------------
// Rooms
// -----------------------------------------------------------------------------
void BrokerEngine::handleSubscribe(const nlohmann::json& cmd, Reply& reply) {
  auto room = requireString(cmd, "room");
  if (!room.ok()) return reply(errorReply(room.error()));
  auto connection_id = requireString(cmd, "connection_id");
  if (!connection_id.ok()) return reply(errorReply(connection_id.error()));

  auto peer = resolvePeer(room.value(), connection_id.value(), cmd);
  if (!peer.ok()) return reply(errorReply(peer.error()));

  const auto cursor = cursorField(cmd);
  auto events = [&]() -> Result<std::vector<StreamEvent>> {
    if (auto symbol = stocks_->symbolForRoom(room.value())) {
      // Same path as subscribe_stock: stock buffer bound and a subscription
      // record for the sweep.
      summary_->recordActivity();
      return stocks_->subscribeToStock(connection_id.value(), peer.value(),
                                       *symbol, cursor);
    }

    std::optional<std::size_t> buffer_size;
    if (room.value() == stocks_->marketRoom()) {
      summary_->recordActivity();
      buffer_size = stocks_->roomBufferSize();
    }
    Status admitted =
        registry_->addConnection(room.value(), connection_id.value(),
                                 peer.value(), cursor, buffer_size);
    if (!admitted.ok()) {
      return admitted.error();
    }
    return replay_->eventsSince(room.value(), cursor);
  }();
  if (!events.ok()) return reply(errorReply(events.error()));

  // Signaling rooms announce the newcomer to everyone already present.
  if (!stocks_->isPublicRoom(room.value())) {
    auto announced = broadcaster_->broadcast(
        room.value(), EventKind::PeerJoined, peerJoinedPayload(peer.value()));
    if (!announced.ok()) return reply(errorReply(announced.error()));
  }

  nlohmann::json r = okReply();
  r["room"] = room.value();
  r["connection_id"] = connection_id.value();
  r["peer_id"] = peer.value();
  r["events"] = eventsToJson(events.value());
  r["stream"] = renderStream(events.value(), config_.retry_hint_ms);
  reply(std::move(r));
}

void BrokerEngine::handleUnsubscribe(const nlohmann::json& cmd, Reply& reply) {
  auto connection_id = requireString(cmd, "connection_id");
  if (!connection_id.ok()) return reply(errorReply(connection_id.error()));

  auto connection = registry_->connection(connection_id.value());
  Status removed = registry_->removeConnection(connection_id.value());
  store_->removeSubscription(connection_id.value());
  if (!removed.ok() || !connection) {
    return reply(errorReply(removed.ok()
                                ? makeError(ErrorCode::NotFound,
                                            "connection not found")
                                : removed.error()));
  }

  loop_.eventBus().publish(ConnectionClosed{
      connection->connection_id, connection->room_id, "unsubscribe"});

  if (!stocks_->isPublicRoom(connection->room_id)) {
    auto announced = broadcaster_->broadcast(
        connection->room_id, EventKind::PeerLeft,
        peerLeftPayload(connection->peer_id));
    if (!announced.ok()) return reply(errorReply(announced.error()));
  }

  nlohmann::json r = okReply();
  r["room"] = connection->room_id;
  reply(std::move(r));
}

void BrokerEngine::handleTouch(const nlohmann::json& cmd, Reply& reply) {
  auto connection_id = requireString(cmd, "connection_id");
  if (!connection_id.ok()) return reply(errorReply(connection_id.error()));

  Status touched = registry_->touchConnection(connection_id.value());
  if (!touched.ok()) return reply(errorReply(touched.error()));
  reply(okReply());
}

void BrokerEngine::handleBroadcast(const nlohmann::json& cmd, Reply& reply) {
  auto room = requireString(cmd, "room");
  if (!room.ok()) return reply(errorReply(room.error()));
  auto kind_name = requireString(cmd, "event");
  if (!kind_name.ok()) return reply(errorReply(kind_name.error()));

  auto kind = eventKindFromString(kind_name.value());
  if (!kind) {
    return reply(errorReply(makeError(
        ErrorCode::InvalidInput, "unknown event kind: " + kind_name.value())));
  }

  // Payload is opaque: strings are stored as given, structured values are
  // serialised once here.
  std::string payload;
  auto payload_it = cmd.find("payload");
  if (payload_it != cmd.end()) {
    payload = payload_it->is_string() ? payload_it->get<std::string>()
                                      : payload_it->dump();
  }

  auto targets = broadcaster_->broadcast(room.value(), *kind,
                                         std::move(payload));
  if (!targets.ok()) return reply(errorReply(targets.error()));

  nlohmann::json r = okReply();
  r["event_id"] = event_ids_.last_issued();
  r["targets"] = targets.value();
  reply(std::move(r));
}

void BrokerEngine::handleReplay(const nlohmann::json& cmd, Reply& reply) {
  auto room = requireString(cmd, "room");
  if (!room.ok()) return reply(errorReply(room.error()));

  auto events = replay_->eventsSince(room.value(), cursorField(cmd));
  if (!events.ok()) return reply(errorReply(events.error()));

  nlohmann::json r = okReply();
  r["events"] = eventsToJson(events.value());
  r["stream"] = renderStream(events.value(), config_.retry_hint_ms);
  reply(std::move(r));
}

void BrokerEngine::handleRoomStats(const nlohmann::json& cmd, Reply& reply) {
  auto room = requireString(cmd, "room");
  if (!room.ok()) return reply(errorReply(room.error()));

  auto stats = registry_->roomStats(room.value());
  if (!stats.ok()) return reply(errorReply(stats.error()));

  nlohmann::json r = okReply();
  r["connections"] = stats.value().connections;
  r["buffered_events"] = stats.value().buffered_events;
  reply(std::move(r));
}

void BrokerEngine::handleStats(Reply& reply) {
  const GlobalStats stats = registry_->globalStats();

  nlohmann::json r = okReply();
  r["rooms"] = stats.rooms;
  r["connections"] = stats.connections;
  r["buffered_events"] = stats.buffered_events;
  r["cache_entries"] = store_->listCacheKeys().size();
  r["stock_subscriptions"] = store_->listSubscriptionIds().size();
  r["fetches_in_flight"] = cache_->inFlightCount();
  r["last_event_id"] = event_ids_.last_issued();
  reply(std::move(r));
}

// -----------------------------------------------------------------------------
// Stocks
// -----------------------------------------------------------------------------
void BrokerEngine::handleStock(const nlohmann::json& cmd, Reply& reply) {
  auto symbol = requireString(cmd, "symbol");
  if (!symbol.ok()) return reply(errorReply(symbol.error()));

  // Suspension point: the reply is sent from the provider completion.
  stocks_->getStock(symbol.value(), [reply](Result<domain::Stock> result) {
    if (!result.ok()) {
      reply(errorReply(result.error()));
      return;
    }
    nlohmann::json r = okReply();
    r["stock"] = result.value();
    reply(std::move(r));
  });
}

void BrokerEngine::handleStockCached(const nlohmann::json& cmd,
                                     Reply& reply) {
  auto symbol = requireString(cmd, "symbol");
  if (!symbol.ok()) return reply(errorReply(symbol.error()));

  auto stock = stocks_->getCachedStock(symbol.value());
  if (!stock.ok()) return reply(errorReply(stock.error()));

  nlohmann::json r = okReply();
  r["stock"] = stock.value();
  reply(std::move(r));
}

void BrokerEngine::handleStockNews(const nlohmann::json& cmd, Reply& reply) {
  auto symbol = requireString(cmd, "symbol");
  if (!symbol.ok()) return reply(errorReply(symbol.error()));

  const auto news =
      cmd.value("news", std::vector<std::string>());
  auto sent = stocks_->broadcastStockNews(symbol.value(), news);
  if (!sent.ok()) return reply(errorReply(sent.error()));

  nlohmann::json r = okReply();
  r["targets"] = sent.value();
  reply(std::move(r));
}

void BrokerEngine::handleSubscribeStock(const nlohmann::json& cmd,
                                        Reply& reply) {
  auto connection_id = requireString(cmd, "connection_id");
  if (!connection_id.ok()) return reply(errorReply(connection_id.error()));
  auto symbol = requireString(cmd, "symbol");
  if (!symbol.ok()) return reply(errorReply(symbol.error()));

  const std::string room_id = stocks_->roomFor(symbol.value());
  auto peer = resolvePeer(room_id, connection_id.value(), cmd);
  if (!peer.ok()) return reply(errorReply(peer.error()));

  // A market-data subscriber keeps the summary refresh alive.
  summary_->recordActivity();

  auto events = stocks_->subscribeToStock(connection_id.value(), peer.value(),
                                          symbol.value(), cursorField(cmd));
  if (!events.ok()) return reply(errorReply(events.error()));

  nlohmann::json r = okReply();
  r["room"] = room_id;
  r["peer_id"] = peer.value();
  r["events"] = eventsToJson(events.value());
  r["stream"] = renderStream(events.value(), config_.retry_hint_ms);
  reply(std::move(r));
}

void BrokerEngine::handleUnsubscribeStock(const nlohmann::json& cmd,
                                          Reply& reply) {
  auto connection_id = requireString(cmd, "connection_id");
  if (!connection_id.ok()) return reply(errorReply(connection_id.error()));

  auto connection = registry_->connection(connection_id.value());
  Status removed = stocks_->unsubscribeFromStock(connection_id.value());
  if (!removed.ok()) return reply(errorReply(removed.error()));

  if (connection) {
    loop_.eventBus().publish(ConnectionClosed{
        connection->connection_id, connection->room_id, "unsubscribe"});
  }
  reply(okReply());
}

// -----------------------------------------------------------------------------
// Summary and history
// -----------------------------------------------------------------------------
void BrokerEngine::handleSummary(Reply& reply) {
  auto summary = summary_->getSummary();
  if (!summary.ok()) return reply(errorReply(summary.error()));

  nlohmann::json r = okReply();
  r["stocks"] = summary.value();
  r["cached_at"] = summary_->cache().current()->cached_at_ms;
  reply(std::move(r));
}

void BrokerEngine::handleSummaryRefresh(const nlohmann::json& cmd,
                                        Reply& reply) {
  auto respond = [this, reply](Result<domain::MarketSummary> result) {
    if (!result.ok()) {
      reply(errorReply(result.error()));
      return;
    }
    nlohmann::json r = okReply();
    r["stocks"] = result.value();
    if (const auto& current = summary_->cache().current()) {
      r["cached_at"] = current->cached_at_ms;
    }
    reply(std::move(r));
  };

  if (cmd.value("force", false)) {
    // A forced refresh is still a summary read.
    summary_->recordActivity();
    summary_->refreshSummaryViaProvider(std::move(respond));
  } else {
    summary_->getSummaryOrRefresh(std::move(respond));
  }
}

void BrokerEngine::handlePriceHistory(Reply& reply) {
  nlohmann::json snapshots = nlohmann::json::array();
  for (const auto& snapshot : price_history_->history()) {
    nlohmann::json s;
    s["timestamp"] = snapshot.timestamp_ms;
    s["prices"] = snapshot.prices;
    snapshots.push_back(std::move(s));
  }

  nlohmann::json r = okReply();
  r["snapshots"] = std::move(snapshots);
  r["capacity"] = price_history_->capacity();
  reply(std::move(r));
}

void BrokerEngine::handlePriceSnapshot(const nlohmann::json& cmd,
                                       Reply& reply) {
  const auto symbols =
      cmd.value("symbols", config_.tracked_symbols);

  snapshots_->capture(
      symbols, [this, reply](Result<domain::PriceSnapshot> result) {
        if (!result.ok()) {
          reply(errorReply(result.error()));
          return;
        }
        nlohmann::json r = okReply();
        r["timestamp"] = result.value().timestamp_ms;
        r["prices"] = result.value().prices;
        r["history_length"] = price_history_->size();
        reply(std::move(r));
      });
}

// -----------------------------------------------------------------------------
// Maintenance
// -----------------------------------------------------------------------------
void BrokerEngine::handleSweep(Reply& reply) {
  const MaintenanceReport report = runMaintenance();

  nlohmann::json r = okReply();
  r["connections_removed"] = report.sweep.connections_removed;
  r["subscriptions_removed"] = report.sweep.subscriptions_removed;
  r["events_expired"] = report.sweep.events_expired;
  r["rooms_removed"] = report.sweep.rooms_removed;
  r["errors"] = report.sweep.errors;
  r["cache_entries_purged"] = report.cache_entries_purged;
  reply(std::move(r));
}

void BrokerEngine::handleScheduler(const nlohmann::json& cmd, Reply& reply) {
  const std::string action = cmd.value("action", std::string("status"));
  if (action == "stop") {
    summary_->stop();
  } else if (action != "status") {
    return reply(errorReply(
        makeError(ErrorCode::InvalidInput, "unknown action: " + action)));
  }

  const RefreshScheduler& scheduler = summary_->scheduler();
  nlohmann::json r = okReply();
  r["state"] = refreshStateToString(scheduler.state());
  r["refreshes"] = scheduler.refreshesTriggered();
  r["refresh_in_flight"] = summary_->refreshInFlight();
  reply(std::move(r));
}

}  // namespace relay
