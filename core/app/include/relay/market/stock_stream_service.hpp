#pragma once

#include "relay/cache/cache_entry_manager.hpp"
#include "relay/domain/broker_config.hpp"
#include "relay/domain/error.hpp"
#include "relay/domain/stock.hpp"
#include "relay/events/stream_event.hpp"
#include "relay/rooms/broadcast_engine.hpp"
#include "relay/rooms/replay_service.hpp"
#include "relay/rooms/room_registry.hpp"
#include "relay/store/i_state_store.hpp"
#include "relay/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// StockStreamService: per-symbol rooms on top of rooms and cache
// -----------------------------------------------------------------------------
//
// @brief  Subscribes connections to a symbol's room, broadcasts price, news
//         and summary events, and serves cache-shielded stock reads.
//
// @details
// Every symbol has a dedicated room "<stock_room_prefix>_<SYMBOL>" with a
// shorter buffer (stock_room_buffer_size) than signaling rooms. Summaries go
// to the single market room. Payloads:
//
//   price-update   {"type":"price_update","stock_id","current_price",
//                   "price_history","metrics","timestamp"}
//   news-update    {"type":"news_update","stock_id","news","timestamp"}
//   market-summary {"type":"market_summary","stocks":{...},"timestamp"}
//
// getStock() goes through CacheEntryManager::getOrFetch(). When the value
// did not come from the cache, a price-update is broadcast to the symbol's
// room so subscribers see the fresh data too.
//
// Thread model: Request loop only.
// -----------------------------------------------------------------------------
class StockStreamService {
 public:
  using StockCallback = std::function<void(Result<domain::Stock>)>;

  StockStreamService(IStateStore& store, RoomRegistry& registry,
                     BroadcastEngine& broadcaster, const ReplayService& replay,
                     CacheEntryManager& cache,
                     const ITimeProvider& time_provider,
                     const domain::BrokerConfig& config);

  StockStreamService(const StockStreamService&) = delete;
  StockStreamService& operator=(const StockStreamService&) = delete;

  std::string roomFor(const std::string& symbol) const;
  const std::string& marketRoom() const { return market_room_id_; }

  // True for rooms that admit anonymous peers (stock rooms, market room).
  bool isPublicRoom(const std::string& room_id) const;

  // Inverse of roomFor(): "stock_TCS" -> "TCS". std::nullopt for any room
  // that is not a stock room, the market room included.
  std::optional<std::string> symbolForRoom(const std::string& room_id) const;

  // Buffer bound for stock rooms and the market room.
  std::size_t roomBufferSize() const { return room_buffer_size_; }

  // -------------------------------------------------------------------------
  // subscribeToStock(...)
  // -------------------------------------------------------------------------
  // @brief  Admits the connection to the symbol's room, records the
  //         StockSubscription and returns the replay for its cursor.
  //
  // @return Buffered events after last_event_id, or AdmissionRejected.
  // -------------------------------------------------------------------------
  Result<std::vector<StreamEvent>> subscribeToStock(
      const std::string& connection_id, const std::string& peer_id,
      const std::string& symbol, std::optional<std::uint64_t> last_event_id);

  // Removes the subscription and the connection. NotFound if neither
  // existed.
  Status unsubscribeFromStock(const std::string& connection_id);

  // Return the number of connections targeted.
  Result<std::size_t> broadcastStockUpdate(const std::string& symbol,
                                           const domain::Stock& stock);
  Result<std::size_t> broadcastStockNews(const std::string& symbol,
                                         const std::vector<std::string>& news);
  Result<std::size_t> broadcastMarketSummary(
      const domain::MarketSummary& summary);

  void getStock(const std::string& symbol, StockCallback done);

  // Synchronous cached read; NotFound when nothing usable is cached.
  Result<domain::Stock> getCachedStock(const std::string& symbol);

 private:
  IStateStore& store_;
  RoomRegistry& registry_;
  BroadcastEngine& broadcaster_;
  const ReplayService& replay_;
  CacheEntryManager& cache_;
  const ITimeProvider& time_provider_;

  const std::string room_prefix_;
  const std::size_t room_buffer_size_;
  const std::string market_room_id_;
};

}  // namespace relay
