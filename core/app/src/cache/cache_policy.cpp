#include "relay/cache/cache_policy.hpp"

#include "relay/time/time_utils.hpp"

namespace relay {

bool isFresh(const domain::StockCacheEntry& entry, std::int64_t now_ms) {
  return now_ms < entry.expiry_time_ms;
}

bool isExpired(const domain::StockCacheEntry& entry, std::int64_t now_ms) {
  return now_ms > entry.expiry_time_ms;
}

bool isRateLimited(const domain::StockCacheEntry& entry, std::int64_t now_ms,
                   const CachePolicy& policy) {
  return entry.access_count > policy.max_access_count &&
         elapsed_since(now_ms, entry.last_access_ms) <
             policy.rate_limit_interval_ms;
}

bool shouldRefresh(const domain::StockCacheEntry& entry, std::int64_t now_ms,
                   const CachePolicy& policy) {
  if (isRateLimited(entry, now_ms, policy)) {
    return false;
  }
  if (isExpired(entry, now_ms)) {
    return true;
  }
  return entry.access_count > policy.max_access_count;
}

}  // namespace relay
