#pragma once

#include "relay/store/i_state_store.hpp"

#include <map>

namespace relay {

// -----------------------------------------------------------------------------
// InMemoryStateStore
// -----------------------------------------------------------------------------
// Responsibility: IStateStore backed by four std::map instances. Used by the
// executable and by every test. Nothing survives a restart, which matches
// the broker's at-least-once-within-window contract.
//
// std::map rather than unordered_map so listing is ordered by key and sweep
// results are reproducible in tests.
//
// Thread model: Not thread-safe. Owned by BrokerEngine and only touched from
// the request loop.
// -----------------------------------------------------------------------------
class InMemoryStateStore final : public IStateStore {
 public:
  std::optional<domain::Room> getRoom(const std::string& room_id) const override;
  void putRoom(const domain::Room& room) override;
  bool removeRoom(const std::string& room_id) override;
  std::vector<std::string> listRoomIds() const override;

  std::optional<domain::Connection> getConnection(
      const std::string& connection_id) const override;
  void putConnection(const domain::Connection& connection) override;
  bool removeConnection(const std::string& connection_id) override;
  std::vector<std::string> listConnectionIds() const override;

  std::optional<domain::StockCacheEntry> getCacheEntry(
      const std::string& key) const override;
  void putCacheEntry(const domain::StockCacheEntry& entry) override;
  bool removeCacheEntry(const std::string& key) override;
  std::vector<std::string> listCacheKeys() const override;

  std::optional<domain::StockSubscription> getSubscription(
      const std::string& connection_id) const override;
  void putSubscription(const domain::StockSubscription& subscription) override;
  bool removeSubscription(const std::string& connection_id) override;
  std::vector<std::string> listSubscriptionIds() const override;

 private:
  std::map<std::string, domain::Room> rooms_;
  std::map<std::string, domain::Connection> connections_;
  std::map<std::string, domain::StockCacheEntry> cache_entries_;
  std::map<std::string, domain::StockSubscription> subscriptions_;
};

}  // namespace relay
