#pragma once

#include "relay/cache/i_data_provider.hpp"
#include "relay/domain/broker_config.hpp"
#include "relay/domain/error.hpp"
#include "relay/domain/stock.hpp"
#include "relay/market/refresh_scheduler.hpp"
#include "relay/market/summary_cache.hpp"
#include "relay/time/i_time_provider.hpp"
#include "relay/timer/i_timer_host.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// MarketSummaryService: global summary cache + refresh scheduler
// -----------------------------------------------------------------------------
//
// @brief  Serves the aggregate market view and keeps it warm while clients
//         are reading it.
//
// @details
// Every summary read (getSummary, getSummaryOrRefresh) first records
// activity and makes sure the RefreshScheduler is running. Then:
//
//   getSummary()            synchronous. Fresh cache → the summary; else
//                           NotFound. Never touches the provider, so it can
//                           serve contexts that cannot suspend.
//   getSummaryOrRefresh()   fresh cache → immediately; else refresh first.
//
// refreshSummaryViaProvider():
//   Fetches every tracked symbol from the provider in parallel. When all
//   fetches have completed, if at least one succeeded the cache is
//   overwritten wholesale with {data, cached_at = now}, the scheduler is
//   started if Idle and the refreshed hook runs; if every fetch failed the caller gets ProviderFailure and the
//   previous cache is kept. A refresh requested while one is in flight joins
//   it instead of starting a second round of fetches.
//
// Suspension point:
//   The cache is written in the completion of the LAST fetch, with the clock
//   read there. Nothing from before the fetches is reused, and other writers
//   (a request-triggered refresh racing a timer tick) are tolerated because
//   the write is a whole-value replacement.
//
// Thread model:
//   Request loop only.
// -----------------------------------------------------------------------------
class MarketSummaryService {
 public:
  using SummaryCallback = std::function<void(Result<domain::MarketSummary>)>;
  using RefreshedHook =
      std::function<void(const CachedSummary& summary, std::size_t failed)>;

  MarketSummaryService(IDataProvider& provider,
                       const ITimeProvider& time_provider, ITimerHost& timers,
                       const domain::BrokerConfig& config);

  MarketSummaryService(const MarketSummaryService&) = delete;
  MarketSummaryService& operator=(const MarketSummaryService&) = delete;

  Result<domain::MarketSummary> getSummary();

  void getSummaryOrRefresh(SummaryCallback done);

  void refreshSummaryViaProvider(SummaryCallback done);

  // Runs after each successful refresh, before the waiters are answered.
  void setOnRefreshed(RefreshedHook hook) { on_refreshed_ = std::move(hook); }

  // Records activity without reading (stock subscriptions count as activity).
  void recordActivity() { cache_.recordActivity(); }

  // Explicit shutdown of the background refresh.
  void stop() { scheduler_.stop(); }

  bool refreshInFlight() const { return in_flight_ != nullptr; }

  RefreshScheduler& scheduler() { return scheduler_; }
  const RefreshScheduler& scheduler() const { return scheduler_; }
  const SummaryCache& cache() const { return cache_; }

 private:
  struct RefreshBatch {
    std::size_t remaining{0};
    std::size_t failed{0};
    domain::MarketSummary data;
    std::vector<SummaryCallback> waiters;
  };

  void noteRead();
  void onSymbolFetched(const std::shared_ptr<RefreshBatch>& batch,
                       const std::string& symbol,
                       Result<domain::Stock> result);
  void finishBatch(const std::shared_ptr<RefreshBatch>& batch);

  IDataProvider& provider_;
  const std::vector<std::string> tracked_symbols_;

  SummaryCache cache_;
  RefreshScheduler scheduler_;
  RefreshedHook on_refreshed_;

  std::shared_ptr<RefreshBatch> in_flight_;
};

}  // namespace relay
