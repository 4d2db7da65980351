#pragma once

#include "relay/cache/i_data_provider.hpp"
#include "relay/domain/error.hpp"
#include "relay/domain/price_snapshot.hpp"
#include "relay/market/price_history_ring.hpp"
#include "relay/time/i_time_provider.hpp"
#include "relay/timer/i_timer_host.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// PriceSnapshotService: feeds the PriceHistoryRing
// -----------------------------------------------------------------------------
//
// @brief  Samples current prices straight from the provider and appends one
//         PriceSnapshot per capture. Runs on its own timer, independent of
//         the per-stock cache and of the summary refresh.
//
// @details
//   capture(symbols)   fetches every distinct symbol in parallel. Once all
//                      fetches have completed, the symbols that succeeded
//                      form one snapshot stamped with the completion time.
//                      If none succeeded the ring is left untouched and the
//                      caller gets ProviderFailure. An empty list is
//                      InvalidInput.
//   startPeriodic()    captures `symbols` every interval_ms until
//                      stopPeriodic(). Failures are logged, never fatal.
//
// Thread model: Request loop only.
// -----------------------------------------------------------------------------
class PriceSnapshotService {
 public:
  using CaptureCallback = std::function<void(Result<domain::PriceSnapshot>)>;

  PriceSnapshotService(IDataProvider& provider,
                       const ITimeProvider& time_provider, ITimerHost& timers,
                       PriceHistoryRing& ring);
  ~PriceSnapshotService();

  PriceSnapshotService(const PriceSnapshotService&) = delete;
  PriceSnapshotService& operator=(const PriceSnapshotService&) = delete;

  void capture(const std::vector<std::string>& symbols, CaptureCallback done);

  void startPeriodic(std::int64_t interval_ms,
                     std::vector<std::string> symbols);
  void stopPeriodic();
  bool periodicRunning() const { return timer_id_ != 0; }

  std::uint64_t snapshotsRecorded() const { return snapshots_recorded_; }

 private:
  struct Capture {
    std::size_t remaining{0};
    domain::PriceSnapshot snapshot;
    CaptureCallback done;
  };

  void onFetched(const std::shared_ptr<Capture>& capture,
                 const std::string& symbol, Result<domain::Stock> result);

  IDataProvider& provider_;
  const ITimeProvider& time_provider_;
  ITimerHost& timers_;
  PriceHistoryRing& ring_;

  ITimerHost::TimerId timer_id_{0};
  std::uint64_t snapshots_recorded_{0};
};

}  // namespace relay
