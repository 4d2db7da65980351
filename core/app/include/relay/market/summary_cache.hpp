#pragma once

#include "relay/domain/stock.hpp"
#include "relay/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>

namespace relay {

// The one process-wide aggregate, replaced wholesale on every refresh.
struct CachedSummary {
  domain::MarketSummary data;
  std::int64_t cached_at_ms{0};
};

// -----------------------------------------------------------------------------
// SummaryCache: global summary value plus the last-activity timestamp
// -----------------------------------------------------------------------------
//
// @details
//   fresh()             → the cached summary if now - cached_at < ttl
//   hasRecentActivity() → an activity was recorded and
//                         now - last_activity < activity_window
//
// Before the first recordActivity() there is no activity at all, so the
// background refresh never starts itself from a cold process.
//
// Thread model: Request loop only.
// -----------------------------------------------------------------------------
class SummaryCache {
 public:
  SummaryCache(const ITimeProvider& time_provider, std::int64_t ttl_ms,
               std::int64_t activity_window_ms);

  void recordActivity();
  bool hasRecentActivity() const;
  std::optional<std::int64_t> lastActivity() const { return last_activity_ms_; }

  std::optional<domain::MarketSummary> fresh() const;

  // Cached value regardless of age.
  const std::optional<CachedSummary>& current() const { return cached_; }

  // Overwrites the cache with cached_at = now.
  void store(domain::MarketSummary data);

 private:
  const ITimeProvider& time_provider_;
  const std::int64_t ttl_ms_;
  const std::int64_t activity_window_ms_;

  std::optional<CachedSummary> cached_;
  std::optional<std::int64_t> last_activity_ms_;
};

}  // namespace relay
