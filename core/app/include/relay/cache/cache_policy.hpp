#pragma once

#include "relay/domain/broker_config.hpp"
#include "relay/domain/stock.hpp"

#include <cstdint>

namespace relay {

// -----------------------------------------------------------------------------
// CachePolicy: freshness rules for one StockCacheEntry
// -----------------------------------------------------------------------------
//
// @brief  Pure functions of (entry, now). No state, no I/O.
//
// @details
//   fresh         now < expiry_time
//   expired       now > expiry_time
//   rate-limited  access_count > max_access_count
//                 AND now - last_access < rate_limit_interval
//
// shouldRefresh() decides in this order:
//   1. rate-limited                       → false  (serve, bound upstream load)
//   2. expired                            → true   (hard expiry)
//   3. access_count > max_access_count    → true   (window elapsed, reset)
//   4. otherwise                          → false  (usable as is)
//
// The rate-limit test comes first so that a heavily read entry is served
// even past its nominal expiry until the read burst pauses for a full
// interval. The next read after that pause refetches.
// -----------------------------------------------------------------------------
struct CachePolicy {
  std::int64_t cache_duration_ms{0};
  std::int64_t rate_limit_interval_ms{0};
  std::uint32_t max_access_count{0};

  static CachePolicy fromConfig(const domain::BrokerConfig& config) {
    return CachePolicy{config.cache_duration_ms, config.rate_limit_interval_ms,
                       config.max_access_count_per_period};
  }
};

bool isFresh(const domain::StockCacheEntry& entry, std::int64_t now_ms);

bool isExpired(const domain::StockCacheEntry& entry, std::int64_t now_ms);

bool isRateLimited(const domain::StockCacheEntry& entry, std::int64_t now_ms,
                   const CachePolicy& policy);

bool shouldRefresh(const domain::StockCacheEntry& entry, std::int64_t now_ms,
                   const CachePolicy& policy);

}  // namespace relay
