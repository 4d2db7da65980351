#pragma once

#include "relay/domain/room.hpp"
#include "relay/domain/stock.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// IStateStore: keyed persistence for broker records
// -----------------------------------------------------------------------------
//
// @brief  get / put / remove per record type plus key listing for sweeps.
//
// @details
// Rooms, connections, cache entries and stock subscriptions are each keyed
// independently (room id, connection id, cache key, connection id) so that
// unrelated keys never touch each other's records.
//
// Records cross this boundary BY VALUE. get*() returns a copy; a caller that
// wants to change a record reads it, edits the copy and put*()s it back
// (whole-record replacement, last writer wins). This keeps the interface
// implementable by an out-of-process key-value store, and it means a value
// read before a suspension point is a snapshot, not a live view.
//
// Restart recovery is the implementation's concern. The broker never assumes
// in-process durability beyond what the store provides.
//
// Thread model:
//   Called only from the request loop. Implementations need not lock.
// -----------------------------------------------------------------------------
class IStateStore {
 public:
  virtual ~IStateStore() = default;

  // --- Rooms -----------------------------------------------------------------
  virtual std::optional<domain::Room> getRoom(const std::string& room_id) const = 0;
  virtual void putRoom(const domain::Room& room) = 0;
  virtual bool removeRoom(const std::string& room_id) = 0;
  virtual std::vector<std::string> listRoomIds() const = 0;

  // --- Connections -----------------------------------------------------------
  virtual std::optional<domain::Connection> getConnection(
      const std::string& connection_id) const = 0;
  virtual void putConnection(const domain::Connection& connection) = 0;
  virtual bool removeConnection(const std::string& connection_id) = 0;
  virtual std::vector<std::string> listConnectionIds() const = 0;

  // --- Stock cache entries ---------------------------------------------------
  virtual std::optional<domain::StockCacheEntry> getCacheEntry(
      const std::string& key) const = 0;
  virtual void putCacheEntry(const domain::StockCacheEntry& entry) = 0;
  virtual bool removeCacheEntry(const std::string& key) = 0;
  virtual std::vector<std::string> listCacheKeys() const = 0;

  // --- Stock subscriptions (keyed by connection id) --------------------------
  virtual std::optional<domain::StockSubscription> getSubscription(
      const std::string& connection_id) const = 0;
  virtual void putSubscription(const domain::StockSubscription& subscription) = 0;
  virtual bool removeSubscription(const std::string& connection_id) = 0;
  virtual std::vector<std::string> listSubscriptionIds() const = 0;
};

}  // namespace relay
