#pragma once

#include "relay/time/time_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace relay {
namespace domain {

// -----------------------------------------------------------------------------
// BrokerConfig: every tunable threshold of the broker in one value struct
// -----------------------------------------------------------------------------
//
// @brief  Room limits, retention windows, cache policy constants, the summary
//         refresh cadence and transport endpoints.
//
// @details
// Components take the config (or the slice they need) by value at
// construction and never observe later changes. All durations are int64_t
// milliseconds so they compare directly against ITimeProvider::now_ms().
//
// Defaults reproduce the production deployment. A JSON file can override any
// subset of fields (see config/config_loader.hpp).
//
// Thread model:
//   Plain data with value semantics. Copied into components; no shared
//   mutable state.
// -----------------------------------------------------------------------------
struct BrokerConfig {
  // --- Rooms and connections -------------------------------------------------

  /// Admission limit. The (limit + 1)-th connection is rejected, never
  /// truncated.
  std::size_t max_connections_per_room{100};

  /// Event buffer bound for signaling rooms. Oldest events are evicted first.
  std::size_t max_buffer_size_per_room{1000};

  /// A connection silent for longer than this is removed by the sweep. An
  /// empty room inactive for longer than this is deleted.
  std::int64_t connection_timeout_ms{minutes(5)};

  /// Buffered events older than this are dropped by the sweep.
  std::int64_t max_event_age_ms{minutes(10)};

  /// Period of the maintenance tick (cleanup sweep + cache purge).
  std::int64_t cleanup_interval_ms{seconds(60)};

  /// Reconnect delay suggested to stream clients in the leading retry line.
  std::int64_t retry_hint_ms{3000};

  // --- Stock streaming -------------------------------------------------------

  /// Stock rooms are named "<prefix>_<SYMBOL>".
  std::string stock_room_prefix{"stock"};

  /// Stock rooms keep a shorter history than signaling rooms.
  std::size_t stock_room_buffer_size{100};

  /// Room receiving market-summary events.
  std::string market_room_id{"market_global"};

  // --- Per-symbol cache ------------------------------------------------------

  /// Lifetime of a freshly fetched cache entry.
  std::int64_t cache_duration_ms{minutes(45)};

  /// Minimum spacing between upstream fetches of a heavily read key.
  std::int64_t rate_limit_interval_ms{seconds(30)};

  /// Reads beyond this count put an entry into the rate-limited regime.
  std::uint32_t max_access_count_per_period{100};

  // --- Global summary --------------------------------------------------------

  /// A cached summary younger than this is served without a fetch.
  std::int64_t summary_ttl_ms{minutes(45)};

  /// Period of the background summary refresh.
  std::int64_t summary_refresh_interval_ms{minutes(30)};

  /// The background refresh stops itself once no summary read or subscribe
  /// has been observed for this long.
  std::int64_t activity_window_ms{hours(6)};

  /// Keys included in the aggregate summary.
  std::vector<std::string> tracked_symbols{"AAPL", "GOOGL", "MSFT", "AMZN",
                                           "TSLA", "NVDA",  "META", "NFLX",
                                           "AMD",  "INTC"};

  // --- Price history ---------------------------------------------------------

  /// 24 hours of 10 minute snapshots.
  std::size_t price_history_capacity{144};

  /// Period of the price sampling that feeds the history ring.
  std::int64_t price_snapshot_interval_ms{minutes(10)};

  // --- Identity --------------------------------------------------------------

  /// Credential → peer id table for the token verifier.
  std::map<std::string, std::string> access_tokens;

  // --- Transport endpoints (executable only; empty disables) -----------------

  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string stream_endpoint{"tcp://127.0.0.1:5557"};

  /// Out-of-process data provider. Empty selects the built-in mock provider.
  std::string provider_endpoint;

  /// Receive timeout for one provider round trip.
  std::int64_t provider_timeout_ms{seconds(10)};
};

}  // namespace domain
}  // namespace relay
