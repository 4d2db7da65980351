#pragma once

#include "relay/domain/broker_config.hpp"
#include "relay/domain/error.hpp"

#include <string>

namespace relay {

// -----------------------------------------------------------------------------
// Config loading
// -----------------------------------------------------------------------------
// BrokerConfig overrides from a JSON object. Keys are the BrokerConfig field
// names; durations are milliseconds. Absent keys keep their defaults; unknown
// keys are ignored. A key with the wrong JSON type, a document that is not an
// object, or an unreadable file yields InvalidInput.
//
//   { "max_connections_per_room": 50,
//     "tracked_symbols": ["AAPL", "MSFT"],
//     "access_tokens": {"secret-1": "alice"},
//     "provider_endpoint": "tcp://127.0.0.1:5560" }
// -----------------------------------------------------------------------------

Result<domain::BrokerConfig> loadConfigFromString(const std::string& text);

Result<domain::BrokerConfig> loadConfigFromFile(const std::string& path);

}  // namespace relay
