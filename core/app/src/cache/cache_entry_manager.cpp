#include "relay/cache/cache_entry_manager.hpp"

#include <iostream>
#include <utility>

namespace relay {

CacheEntryManager::CacheEntryManager(IStateStore& store,
                                     IDataProvider& provider,
                                     const ITimeProvider& time_provider,
                                     CachePolicy policy)
    : store_(store),
      provider_(provider),
      time_provider_(time_provider),
      policy_(policy) {}

// -----------------------------------------------------------------------------
// getOrFetch
// -----------------------------------------------------------------------------
void CacheEntryManager::getOrFetch(const std::string& key,
                                   LookupCallback done) {
  if (auto cached = getCached(key); cached.ok()) {
    std::cout << "[CacheEntryManager] hit key=" << key << std::endl;
    done(CacheLookup{std::move(cached).value(), true});
    return;
  }

  auto it = in_flight_.find(key);
  if (it != in_flight_.end()) {
    it->second.push_back(std::move(done));
    return;
  }

  std::cout << "[CacheEntryManager] miss key=" << key << ", fetching"
            << std::endl;

  // Register before calling the provider: a synchronous provider completes
  // inside fetch() and onFetched() expects to find the waiter list.
  in_flight_[key].push_back(std::move(done));
  provider_.fetch(key, [this, key](Result<domain::Stock> result) {
    onFetched(key, std::move(result));
  });
}

// -----------------------------------------------------------------------------
// onFetched: runs on the loop after the suspension point
// -----------------------------------------------------------------------------
void CacheEntryManager::onFetched(const std::string& key,
                                  Result<domain::Stock> result) {
  auto it = in_flight_.find(key);
  if (it == in_flight_.end()) {
    std::cerr << "[CacheEntryManager] completion for key=" << key
              << " with no waiters" << std::endl;
    return;
  }
  std::vector<LookupCallback> waiters = std::move(it->second);
  in_flight_.erase(it);

  if (!result.ok()) {
    std::cerr << "[CacheEntryManager] provider failure key=" << key << ": "
              << result.error().message << std::endl;
    for (auto& waiter : waiters) {
      waiter(result.error());
    }
    return;
  }

  const std::int64_t now = time_provider_.now_ms();
  domain::StockCacheEntry entry;
  entry.key = key;
  entry.value = std::move(result).value();
  entry.cached_at_ms = now;
  entry.expiry_time_ms = now + policy_.cache_duration_ms;
  entry.access_count = 1;
  entry.last_access_ms = now;
  store_.putCacheEntry(entry);

  for (auto& waiter : waiters) {
    waiter(CacheLookup{entry.value, false});
  }
}

// -----------------------------------------------------------------------------
// getCached
// -----------------------------------------------------------------------------
Result<domain::Stock> CacheEntryManager::getCached(const std::string& key) {
  auto entry = store_.getCacheEntry(key);
  if (!entry) {
    return makeError(ErrorCode::NotFound, "no cache entry for " + key);
  }

  const std::int64_t now = time_provider_.now_ms();
  if (shouldRefresh(*entry, now, policy_)) {
    return makeError(ErrorCode::NotFound, "cache entry for " + key +
                                              " needs refresh");
  }

  ++entry->access_count;
  entry->last_access_ms = now;
  store_.putCacheEntry(*entry);
  return std::move(entry->value);
}

// -----------------------------------------------------------------------------
// purgeExpired
// -----------------------------------------------------------------------------
std::size_t CacheEntryManager::purgeExpired() {
  const std::int64_t now = time_provider_.now_ms();
  std::size_t removed = 0;

  for (const auto& key : store_.listCacheKeys()) {
    if (in_flight_.count(key) > 0) {
      continue;
    }
    auto entry = store_.getCacheEntry(key);
    if (!entry || !isExpired(*entry, now) ||
        isRateLimited(*entry, now, policy_)) {
      continue;
    }
    if (store_.removeCacheEntry(key)) {
      ++removed;
    }
  }

  if (removed > 0) {
    std::cout << "[CacheEntryManager] purged " << removed
              << " expired entries" << std::endl;
  }
  return removed;
}

}  // namespace relay
