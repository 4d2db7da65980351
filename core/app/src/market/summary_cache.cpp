#include "relay/market/summary_cache.hpp"

#include "relay/time/time_utils.hpp"

#include <utility>

namespace relay {

SummaryCache::SummaryCache(const ITimeProvider& time_provider,
                           std::int64_t ttl_ms,
                           std::int64_t activity_window_ms)
    : time_provider_(time_provider),
      ttl_ms_(ttl_ms),
      activity_window_ms_(activity_window_ms) {}

void SummaryCache::recordActivity() {
  last_activity_ms_ = time_provider_.now_ms();
}

bool SummaryCache::hasRecentActivity() const {
  if (!last_activity_ms_) {
    return false;
  }
  return elapsed_since(time_provider_.now_ms(), *last_activity_ms_) <
         activity_window_ms_;
}

std::optional<domain::MarketSummary> SummaryCache::fresh() const {
  if (!cached_) {
    return std::nullopt;
  }
  if (elapsed_since(time_provider_.now_ms(), cached_->cached_at_ms) >=
      ttl_ms_) {
    return std::nullopt;
  }
  return cached_->data;
}

void SummaryCache::store(domain::MarketSummary data) {
  cached_ = CachedSummary{std::move(data), time_provider_.now_ms()};
}

}  // namespace relay
