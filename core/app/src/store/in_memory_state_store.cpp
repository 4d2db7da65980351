#include "relay/store/in_memory_state_store.hpp"

namespace relay {

namespace {

template <typename Record>
std::optional<Record> findRecord(const std::map<std::string, Record>& records,
                                 const std::string& key) {
  auto it = records.find(key);
  if (it == records.end()) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Record>
std::vector<std::string> keysOf(const std::map<std::string, Record>& records) {
  std::vector<std::string> keys;
  keys.reserve(records.size());
  for (const auto& [key, record] : records) {
    keys.push_back(key);
  }
  return keys;
}

}  // namespace

// --- Rooms -------------------------------------------------------------------

std::optional<domain::Room> InMemoryStateStore::getRoom(
    const std::string& room_id) const {
  return findRecord(rooms_, room_id);
}

void InMemoryStateStore::putRoom(const domain::Room& room) {
  rooms_[room.room_id] = room;
}

bool InMemoryStateStore::removeRoom(const std::string& room_id) {
  return rooms_.erase(room_id) > 0;
}

std::vector<std::string> InMemoryStateStore::listRoomIds() const {
  return keysOf(rooms_);
}

// --- Connections -------------------------------------------------------------

std::optional<domain::Connection> InMemoryStateStore::getConnection(
    const std::string& connection_id) const {
  return findRecord(connections_, connection_id);
}

void InMemoryStateStore::putConnection(const domain::Connection& connection) {
  connections_[connection.connection_id] = connection;
}

bool InMemoryStateStore::removeConnection(const std::string& connection_id) {
  return connections_.erase(connection_id) > 0;
}

std::vector<std::string> InMemoryStateStore::listConnectionIds() const {
  return keysOf(connections_);
}

// --- Stock cache entries -----------------------------------------------------

std::optional<domain::StockCacheEntry> InMemoryStateStore::getCacheEntry(
    const std::string& key) const {
  return findRecord(cache_entries_, key);
}

void InMemoryStateStore::putCacheEntry(const domain::StockCacheEntry& entry) {
  cache_entries_[entry.key] = entry;
}

bool InMemoryStateStore::removeCacheEntry(const std::string& key) {
  return cache_entries_.erase(key) > 0;
}

std::vector<std::string> InMemoryStateStore::listCacheKeys() const {
  return keysOf(cache_entries_);
}

// --- Stock subscriptions -----------------------------------------------------

std::optional<domain::StockSubscription> InMemoryStateStore::getSubscription(
    const std::string& connection_id) const {
  return findRecord(subscriptions_, connection_id);
}

void InMemoryStateStore::putSubscription(
    const domain::StockSubscription& subscription) {
  subscriptions_[subscription.connection_id] = subscription;
}

bool InMemoryStateStore::removeSubscription(const std::string& connection_id) {
  return subscriptions_.erase(connection_id) > 0;
}

std::vector<std::string> InMemoryStateStore::listSubscriptionIds() const {
  return keysOf(subscriptions_);
}

}  // namespace relay
