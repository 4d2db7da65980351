#pragma once

#include "relay/cache/cache_policy.hpp"
#include "relay/cache/i_data_provider.hpp"
#include "relay/domain/error.hpp"
#include "relay/domain/stock.hpp"
#include "relay/store/i_state_store.hpp"
#include "relay/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace relay {

// Value returned by the read-through path. cache_hit is false when the value
// came from the provider during this call.
struct CacheLookup {
  domain::Stock stock;
  bool cache_hit{false};
};

// -----------------------------------------------------------------------------
// CacheEntryManager: read-through cache in front of IDataProvider
// -----------------------------------------------------------------------------
//
// @brief  Serves per-key stock snapshots from StockCacheEntry records and
//         refetches them according to CachePolicy.
//
// @details
// getOrFetch(key, done):
//   1. Entry present and !shouldRefresh → access_count += 1,
//      last_access = now, persist, done({value, cache_hit=true}).
//   2. Otherwise ask the provider. While that fetch is outstanding, further
//      getOrFetch() calls for the same key join it instead of issuing a
//      second upstream request.
//   3. Provider success → a brand-new entry {cached_at = now,
//      expiry = now + cache_duration, access_count = 1, last_access = now}
//      replaces whatever is stored. `now` is read AFTER the fetch returns.
//   4. Provider failure → every waiter receives the ProviderFailure. The
//      stored entry, if any, is left exactly as it is and is NOT served.
//
// Suspension point:
//   Between step 2 and the completion other requests run. The completion
//   handler therefore re-reads the clock and writes a whole new entry; it
//   never edits a record it read before the fetch.
//
// Thread model:
//   Request loop only. Provider completions arrive on the loop.
//
// Ownership:
//   Owned by BrokerEngine. The provider must not complete a fetch after this
//   object is destroyed; BrokerEngine stops the provider first.
// -----------------------------------------------------------------------------
class CacheEntryManager {
 public:
  using LookupCallback = std::function<void(Result<CacheLookup>)>;

  CacheEntryManager(IStateStore& store, IDataProvider& provider,
                    const ITimeProvider& time_provider, CachePolicy policy);

  CacheEntryManager(const CacheEntryManager&) = delete;
  CacheEntryManager& operator=(const CacheEntryManager&) = delete;

  void getOrFetch(const std::string& key, LookupCallback done);

  // -------------------------------------------------------------------------
  // getCached(key)
  // -------------------------------------------------------------------------
  // @brief  Synchronous read. Returns the cached value when it is usable
  //         (!shouldRefresh), counting the access. NotFound otherwise.
  //
  // Never calls the provider; safe from contexts that cannot suspend.
  // -------------------------------------------------------------------------
  Result<domain::Stock> getCached(const std::string& key);

  // -------------------------------------------------------------------------
  // purgeExpired()
  // -------------------------------------------------------------------------
  // @brief  Deletes entries past expiry that are not being served under the
  //         rate limit and have no fetch in flight.
  //
  // @return Number of entries removed.
  // -------------------------------------------------------------------------
  std::size_t purgeExpired();

  // Number of keys with an outstanding provider fetch.
  std::size_t inFlightCount() const { return in_flight_.size(); }

  const CachePolicy& policy() const { return policy_; }

 private:
  void onFetched(const std::string& key, Result<domain::Stock> result);

  IStateStore& store_;
  IDataProvider& provider_;
  const ITimeProvider& time_provider_;
  const CachePolicy policy_;

  // key → callers waiting on the one outstanding fetch for that key.
  std::map<std::string, std::vector<LookupCallback>> in_flight_;
};

}  // namespace relay
