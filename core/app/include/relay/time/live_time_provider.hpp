#pragma once

#include "relay/time/i_time_provider.hpp"

namespace relay {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the relay_broker executable. Tests inject SimulationTimeProvider
// instead so that TTLs measured in minutes can be crossed instantly.
//
// Thread model:
//   std::chrono::system_clock::now() is safe to call from any thread.
//   No internal state, no mutex.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  // @brief  Current wall-clock time in milliseconds since epoch.
  std::int64_t now_ms() const override;
};

}  // namespace relay
