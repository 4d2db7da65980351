#include "relay/market/price_history_ring.hpp"

#include <utility>

namespace relay {

void PriceHistoryRing::record(domain::PriceSnapshot snapshot) {
  snapshots_.push_back(std::move(snapshot));
  while (snapshots_.size() > capacity_) {
    snapshots_.pop_front();
  }
}

std::vector<domain::PriceSnapshot> PriceHistoryRing::history() const {
  return {snapshots_.begin(), snapshots_.end()};
}

}  // namespace relay
