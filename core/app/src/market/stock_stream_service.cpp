#include "relay/market/stock_stream_service.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace relay {

StockStreamService::StockStreamService(IStateStore& store,
                                       RoomRegistry& registry,
                                       BroadcastEngine& broadcaster,
                                       const ReplayService& replay,
                                       CacheEntryManager& cache,
                                       const ITimeProvider& time_provider,
                                       const domain::BrokerConfig& config)
    : store_(store),
      registry_(registry),
      broadcaster_(broadcaster),
      replay_(replay),
      cache_(cache),
      time_provider_(time_provider),
      room_prefix_(config.stock_room_prefix),
      room_buffer_size_(config.stock_room_buffer_size),
      market_room_id_(config.market_room_id) {}

std::string StockStreamService::roomFor(const std::string& symbol) const {
  return room_prefix_ + "_" + symbol;
}

bool StockStreamService::isPublicRoom(const std::string& room_id) const {
  const std::string prefix = room_prefix_ + "_";
  return room_id == market_room_id_ ||
         (room_id.size() > prefix.size() &&
          room_id.compare(0, prefix.size(), prefix) == 0);
}

std::optional<std::string> StockStreamService::symbolForRoom(
    const std::string& room_id) const {
  if (room_id == market_room_id_ || !isPublicRoom(room_id)) {
    return std::nullopt;
  }
  return room_id.substr(room_prefix_.size() + 1);
}

// -----------------------------------------------------------------------------
// subscribeToStock
// -----------------------------------------------------------------------------
Result<std::vector<StreamEvent>> StockStreamService::subscribeToStock(
    const std::string& connection_id, const std::string& peer_id,
    const std::string& symbol, std::optional<std::uint64_t> last_event_id) {
  const std::string room_id = roomFor(symbol);

  Status admitted = registry_.addConnection(room_id, connection_id, peer_id,
                                            last_event_id, room_buffer_size_);
  if (!admitted.ok()) {
    return admitted.error();
  }

  domain::StockSubscription subscription;
  subscription.connection_id = connection_id;
  subscription.symbol = symbol;
  subscription.subscribed_at_ms = time_provider_.now_ms();
  subscription.last_event_id = last_event_id;
  store_.putSubscription(subscription);

  return replay_.eventsSince(room_id, last_event_id);
}

// -----------------------------------------------------------------------------
// unsubscribeFromStock
// -----------------------------------------------------------------------------
Status StockStreamService::unsubscribeFromStock(
    const std::string& connection_id) {
  const bool had_subscription = store_.removeSubscription(connection_id);
  Status removed = registry_.removeConnection(connection_id);
  if (!removed.ok() && !had_subscription) {
    return removed;
  }
  return okStatus();
}

// -----------------------------------------------------------------------------
// Broadcast helpers
// -----------------------------------------------------------------------------
Result<std::size_t> StockStreamService::broadcastStockUpdate(
    const std::string& symbol, const domain::Stock& stock) {
  nlohmann::json payload;
  payload["type"] = "price_update";
  payload["stock_id"] = symbol;
  payload["current_price"] = stock.current_price;
  payload["price_history"] = stock.price_history;
  payload["metrics"] = stock.metrics;
  payload["timestamp"] = time_provider_.now_ms();

  const std::string room_id = roomFor(symbol);
  registry_.ensureRoom(room_id, room_buffer_size_);
  auto targets =
      broadcaster_.broadcast(room_id, EventKind::PriceUpdate, payload.dump());
  if (!targets.ok()) {
    return targets.error();
  }
  return targets.value().size();
}

Result<std::size_t> StockStreamService::broadcastStockNews(
    const std::string& symbol, const std::vector<std::string>& news) {
  nlohmann::json payload;
  payload["type"] = "news_update";
  payload["stock_id"] = symbol;
  payload["news"] = news;
  payload["timestamp"] = time_provider_.now_ms();

  const std::string room_id = roomFor(symbol);
  registry_.ensureRoom(room_id, room_buffer_size_);
  auto targets =
      broadcaster_.broadcast(room_id, EventKind::NewsUpdate, payload.dump());
  if (!targets.ok()) {
    return targets.error();
  }
  return targets.value().size();
}

Result<std::size_t> StockStreamService::broadcastMarketSummary(
    const domain::MarketSummary& summary) {
  nlohmann::json payload;
  payload["type"] = "market_summary";
  payload["stocks"] = summary;
  payload["timestamp"] = time_provider_.now_ms();

  registry_.ensureRoom(market_room_id_, room_buffer_size_);
  auto targets = broadcaster_.broadcast(
      market_room_id_, EventKind::MarketSummary, payload.dump());
  if (!targets.ok()) {
    return targets.error();
  }
  return targets.value().size();
}

// -----------------------------------------------------------------------------
// getStock: cache-shielded read, broadcasting fresh provider data
// -----------------------------------------------------------------------------
void StockStreamService::getStock(const std::string& symbol,
                                  StockCallback done) {
  cache_.getOrFetch(symbol, [this, symbol, done = std::move(done)](
                                Result<CacheLookup> lookup) {
    if (!lookup.ok()) {
      done(lookup.error());
      return;
    }
    CacheLookup& found = lookup.value();
    if (!found.cache_hit) {
      auto sent = broadcastStockUpdate(symbol, found.stock);
      if (!sent.ok()) {
        std::cerr << "[StockStreamService] price update for " << symbol
                  << " not broadcast: " << sent.error().message << std::endl;
      }
    }
    done(std::move(found.stock));
  });
}

Result<domain::Stock> StockStreamService::getCachedStock(
    const std::string& symbol) {
  return cache_.getCached(symbol);
}

}  // namespace relay
