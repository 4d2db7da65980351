#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace relay {
namespace domain {

// -----------------------------------------------------------------------------
// StockPrice: one daily bar of a symbol's price history
// -----------------------------------------------------------------------------
struct StockPrice {
  std::int64_t timestamp_ms{0};
  double price{0.0};
  std::uint64_t volume{0};
  double high{0.0};
  double low{0.0};
  double open{0.0};
  double close{0.0};
};

// -----------------------------------------------------------------------------
// StockMetrics: fundamentals attached to a snapshot
// -----------------------------------------------------------------------------
struct StockMetrics {
  double market_cap{0.0};
  double pe_ratio{0.0};
  double eps{0.0};
  double debt_equity_ratio{0.0};
  double business_growth{0.0};
  double industry_avg_pe{0.0};
  std::uint64_t outstanding_shares{0};
  double volatility{0.0};
};

// -----------------------------------------------------------------------------
// Stock: the snapshot the data provider returns and the cache stores
// -----------------------------------------------------------------------------
//
// @details
// Treated as an immutable value: the cache swaps whole Stock values and
// never edits one in place.
// -----------------------------------------------------------------------------
struct Stock {
  std::string id;
  std::string name;
  std::string symbol;
  double current_price{0.0};
  std::vector<StockPrice> price_history;  // Oldest first
  StockMetrics metrics;
  std::vector<std::string> news;
  std::int64_t last_update_ms{0};
};

// Aggregate market view: symbol → snapshot. std::map keeps serialised output
// ordered by symbol.
using MarketSummary = std::map<std::string, Stock>;

// -----------------------------------------------------------------------------
// StockCacheEntry: one time-boxed, access-counted cache record
// -----------------------------------------------------------------------------
//
// @details
// Freshness rules live in cache/cache_policy.hpp. The entry itself is plain
// data; a refresh replaces the whole record.
// -----------------------------------------------------------------------------
struct StockCacheEntry {
  std::string key;
  Stock value;
  std::int64_t cached_at_ms{0};
  std::int64_t expiry_time_ms{0};
  std::uint32_t access_count{0};
  std::int64_t last_access_ms{0};
};

// -----------------------------------------------------------------------------
// JSON mapping (nlohmann ADL hooks)
// -----------------------------------------------------------------------------
// Field names match the data provider's wire format (snake_case,
// "timestamp" and "last_update" in epoch milliseconds). from_json throws
// nlohmann::json::exception on missing keys or wrong types; the provider
// client catches it and reports ProviderFailure.
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const StockPrice& p);
void from_json(const nlohmann::json& j, StockPrice& p);
void to_json(nlohmann::json& j, const StockMetrics& m);
void from_json(const nlohmann::json& j, StockMetrics& m);
void to_json(nlohmann::json& j, const Stock& s);
void from_json(const nlohmann::json& j, Stock& s);

}  // namespace domain
}  // namespace relay
