#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace relay {
namespace domain {

// -----------------------------------------------------------------------------
// PriceSnapshot: one entry of the rolling price history
// -----------------------------------------------------------------------------
struct PriceSnapshot {
  std::int64_t timestamp_ms{0};
  std::map<std::string, double> prices;  // symbol → last price
};

}  // namespace domain
}  // namespace relay
