#include "relay/market/price_snapshot_service.hpp"

#include <iostream>
#include <set>
#include <utility>

namespace relay {

PriceSnapshotService::PriceSnapshotService(IDataProvider& provider,
                                           const ITimeProvider& time_provider,
                                           ITimerHost& timers,
                                           PriceHistoryRing& ring)
    : provider_(provider),
      time_provider_(time_provider),
      timers_(timers),
      ring_(ring) {}

PriceSnapshotService::~PriceSnapshotService() { stopPeriodic(); }

// -----------------------------------------------------------------------------
// capture: one parallel round of fetches, one snapshot
// -----------------------------------------------------------------------------
void PriceSnapshotService::capture(const std::vector<std::string>& symbols,
                                   CaptureCallback done) {
  const std::set<std::string> distinct(symbols.begin(), symbols.end());
  if (distinct.empty() || distinct.count(std::string()) > 0) {
    done(makeError(ErrorCode::InvalidInput,
                   "price snapshot needs non-empty symbols"));
    return;
  }

  auto capture = std::make_shared<Capture>();
  capture->remaining = distinct.size();
  capture->done = std::move(done);

  // remaining is complete before the first fetch: a synchronous provider
  // answers inside fetch().
  for (const auto& symbol : distinct) {
    provider_.fetch(symbol,
                    [this, capture, symbol](Result<domain::Stock> result) {
                      onFetched(capture, symbol, std::move(result));
                    });
  }
}

void PriceSnapshotService::onFetched(const std::shared_ptr<Capture>& capture,
                                     const std::string& symbol,
                                     Result<domain::Stock> result) {
  if (result.ok()) {
    capture->snapshot.prices[symbol] = result.value().current_price;
  } else {
    std::cerr << "[PriceSnapshotService] fetch failed for " << symbol << ": "
              << result.error().message << std::endl;
  }

  if (--capture->remaining > 0) {
    return;
  }

  if (capture->snapshot.prices.empty()) {
    capture->done(makeError(ErrorCode::ProviderFailure,
                            "no price could be fetched for the snapshot"));
    return;
  }

  capture->snapshot.timestamp_ms = time_provider_.now_ms();
  ring_.record(capture->snapshot);
  ++snapshots_recorded_;
  capture->done(std::move(capture->snapshot));
}

// -----------------------------------------------------------------------------
// Periodic sampling
// -----------------------------------------------------------------------------
void PriceSnapshotService::startPeriodic(std::int64_t interval_ms,
                                         std::vector<std::string> symbols) {
  if (timer_id_ != 0) {
    return;
  }
  timer_id_ = timers_.scheduleEvery(
      interval_ms, [this, symbols = std::move(symbols)] {
        capture(symbols, [](Result<domain::PriceSnapshot> result) {
          if (!result.ok()) {
            std::cerr << "[PriceSnapshotService] periodic snapshot failed: "
                      << result.error().message << std::endl;
          }
        });
      });
  std::cout << "[PriceSnapshotService] sampling every " << interval_ms
            << " ms" << std::endl;
}

void PriceSnapshotService::stopPeriodic() {
  if (timer_id_ == 0) {
    return;
  }
  timers_.cancel(timer_id_);
  timer_id_ = 0;
}

}  // namespace relay
