#pragma once

#include "relay/cache/i_data_provider.hpp"
#include "relay/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace relay {

// -----------------------------------------------------------------------------
// generateMockStock(symbol, now_ms)
// -----------------------------------------------------------------------------
// @brief  Deterministic synthetic snapshot for one symbol.
//
// @details
// Seven daily bars ending at now_ms. Each bar moves the price by a factor in
// [-2 %, +2 %) derived from the bar's timestamp, with a 1.5 % intraday range
// either side of the close. Open is the previous bar's close (the first bar
// opens at its own close). Base prices, company names and fundamentals come
// from a fixed table; unknown symbols get a 1000.0 base and default metrics.
// Three news headlines are generated from the name and growth figure.
//
// Same (symbol, now_ms) always yields the same Stock.
// -----------------------------------------------------------------------------
domain::Stock generateMockStock(const std::string& symbol, std::int64_t now_ms);

// -----------------------------------------------------------------------------
// MockDataProvider
// -----------------------------------------------------------------------------
// Responsibility: IDataProvider that never leaves the process. Completes
// every fetch synchronously, inside fetch(), with generateMockStock().
// Default provider of the executable when no provider endpoint is
// configured.
//
// Thread model: Request loop only.
// -----------------------------------------------------------------------------
class MockDataProvider final : public IDataProvider {
 public:
  explicit MockDataProvider(const ITimeProvider& time_provider);

  void fetch(const std::string& key, FetchCallback on_complete) override;

  std::size_t fetchCount() const { return fetch_count_; }

 private:
  const ITimeProvider& time_provider_;
  std::size_t fetch_count_{0};
};

}  // namespace relay
