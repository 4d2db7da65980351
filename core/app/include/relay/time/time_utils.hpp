#pragma once

#include <cstdint>

namespace relay {

// -----------------------------------------------------------------------------
// Duration helpers
// -----------------------------------------------------------------------------
//
// @brief  constexpr conversions into the broker's single time unit (int64_t
//         milliseconds).
//
// @details
// BrokerConfig defaults and tests read much better as `minutes(45)` than as
// `2'700'000`. Everything returned here is plain milliseconds so it composes
// directly with ITimeProvider::now_ms().
// -----------------------------------------------------------------------------

constexpr std::int64_t seconds(std::int64_t s) { return s * 1000; }

constexpr std::int64_t minutes(std::int64_t m) { return seconds(m * 60); }

constexpr std::int64_t hours(std::int64_t h) { return minutes(h * 60); }

constexpr std::int64_t days(std::int64_t d) { return hours(d * 24); }

// -------------------------------------------------------------------------
// elapsed_since
// -------------------------------------------------------------------------
// @brief  Saturating "now - then". A timestamp in the future (clock skew, or
//         a simulation clock moved backwards) counts as zero elapsed time
//         rather than a negative age.
// -------------------------------------------------------------------------
constexpr std::int64_t elapsed_since(std::int64_t now_ms,
                                     std::int64_t then_ms) {
  return now_ms > then_ms ? now_ms - then_ms : 0;
}

}  // namespace relay
