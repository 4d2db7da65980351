#pragma once

#include "relay/domain/price_snapshot.hpp"

#include <cstddef>
#include <deque>
#include <vector>

namespace relay {

// -----------------------------------------------------------------------------
// PriceHistoryRing: fixed-capacity rolling window of price snapshots
// -----------------------------------------------------------------------------
//
// @brief  record() appends; once size() exceeds capacity() the oldest
//         snapshots are dropped from the front.
//
// @details
// Independent of the per-symbol cache. PriceSnapshotService records one
// snapshot per sampling tick; the default capacity of 144 holds a day of
// 10 minute samples.
//
// Invariants: size() <= capacity(); history().front() is the oldest retained
// snapshot. A capacity of 0 retains nothing.
//
// Thread model: Request loop only.
// -----------------------------------------------------------------------------
class PriceHistoryRing {
 public:
  explicit PriceHistoryRing(std::size_t capacity) : capacity_(capacity) {}

  void record(domain::PriceSnapshot snapshot);

  // Copy of the current contents, oldest first. Calling it twice without a
  // record() in between returns the same sequence.
  std::vector<domain::PriceSnapshot> history() const;

  std::size_t size() const { return snapshots_.size(); }
  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  std::deque<domain::PriceSnapshot> snapshots_;
};

}  // namespace relay
