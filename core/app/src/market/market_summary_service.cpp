#include "relay/market/market_summary_service.hpp"

#include <iostream>
#include <utility>

namespace relay {

MarketSummaryService::MarketSummaryService(IDataProvider& provider,
                                           const ITimeProvider& time_provider,
                                           ITimerHost& timers,
                                           const domain::BrokerConfig& config)
    : provider_(provider),
      tracked_symbols_(config.tracked_symbols),
      cache_(time_provider, config.summary_ttl_ms, config.activity_window_ms),
      scheduler_(
          timers, config.summary_refresh_interval_ms,
          [this] { return cache_.hasRecentActivity(); },
          [this] {
            refreshSummaryViaProvider(
                [](Result<domain::MarketSummary> result) {
                  if (!result.ok()) {
                    std::cerr << "[MarketSummaryService] periodic refresh "
                                 "failed: "
                              << result.error().message << std::endl;
                  }
                });
          }) {}

// -----------------------------------------------------------------------------
// noteRead: every summary read counts as activity and wakes the scheduler
// -----------------------------------------------------------------------------
void MarketSummaryService::noteRead() {
  cache_.recordActivity();
  scheduler_.ensureRunning();
}

// -----------------------------------------------------------------------------
// getSummary: cache-only path
// -----------------------------------------------------------------------------
Result<domain::MarketSummary> MarketSummaryService::getSummary() {
  noteRead();
  if (auto fresh = cache_.fresh()) {
    return std::move(*fresh);
  }
  return makeError(ErrorCode::NotFound,
                   "no fresh market summary cached; refresh required");
}

// -----------------------------------------------------------------------------
// getSummaryOrRefresh
// -----------------------------------------------------------------------------
void MarketSummaryService::getSummaryOrRefresh(SummaryCallback done) {
  noteRead();
  if (auto fresh = cache_.fresh()) {
    done(std::move(*fresh));
    return;
  }
  refreshSummaryViaProvider(std::move(done));
}

// -----------------------------------------------------------------------------
// refreshSummaryViaProvider: one coalesced round of fetches
// -----------------------------------------------------------------------------
void MarketSummaryService::refreshSummaryViaProvider(SummaryCallback done) {
  if (in_flight_) {
    in_flight_->waiters.push_back(std::move(done));
    return;
  }

  if (tracked_symbols_.empty()) {
    done(makeError(ErrorCode::ProviderFailure, "no tracked symbols"));
    return;
  }

  auto batch = std::make_shared<RefreshBatch>();
  batch->remaining = tracked_symbols_.size();
  batch->waiters.push_back(std::move(done));
  in_flight_ = batch;

  std::cout << "[MarketSummaryService] refreshing "
            << tracked_symbols_.size() << " symbols" << std::endl;

  // remaining is set in full before the first fetch: a synchronous provider
  // completes inside fetch() and must not finish the batch early.
  for (const auto& symbol : tracked_symbols_) {
    provider_.fetch(symbol,
                    [this, batch, symbol](Result<domain::Stock> result) {
                      onSymbolFetched(batch, symbol, std::move(result));
                    });
  }
}

// -----------------------------------------------------------------------------
// onSymbolFetched: one provider completion (loop thread)
// -----------------------------------------------------------------------------
void MarketSummaryService::onSymbolFetched(
    const std::shared_ptr<RefreshBatch>& batch, const std::string& symbol,
    Result<domain::Stock> result) {
  if (result.ok()) {
    batch->data[symbol] = std::move(result).value();
  } else {
    ++batch->failed;
    std::cerr << "[MarketSummaryService] fetch failed for " << symbol << ": "
              << result.error().message << std::endl;
  }

  if (--batch->remaining == 0) {
    finishBatch(batch);
  }
}

// -----------------------------------------------------------------------------
// finishBatch: publish or fail the whole round
// -----------------------------------------------------------------------------
void MarketSummaryService::finishBatch(
    const std::shared_ptr<RefreshBatch>& batch) {
  // Clear first so a waiter may start the next refresh.
  if (in_flight_ == batch) {
    in_flight_.reset();
  }
  std::vector<SummaryCallback> waiters = std::move(batch->waiters);

  if (batch->data.empty()) {
    std::cerr << "[MarketSummaryService] refresh failed: all "
              << batch->failed << " symbols failed, keeping previous summary"
              << std::endl;
    for (auto& waiter : waiters) {
      waiter(makeError(ErrorCode::ProviderFailure,
                       "failed to fetch any tracked symbol"));
    }
    return;
  }

  cache_.store(batch->data);
  // A successful refresh keeps the background refresh alive, even one that
  // no reader triggered.
  scheduler_.ensureRunning();
  std::cout << "[MarketSummaryService] refreshed " << batch->data.size()
            << " symbols (" << batch->failed << " failed)" << std::endl;

  if (on_refreshed_) {
    on_refreshed_(*cache_.current(), batch->failed);
  }
  for (auto& waiter : waiters) {
    waiter(batch->data);
  }
}

}  // namespace relay
