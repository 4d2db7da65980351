#pragma once

#include "relay/domain/error.hpp"
#include "relay/domain/stock.hpp"

#include <functional>
#include <string>

namespace relay {

// -----------------------------------------------------------------------------
// IDataProvider: the external market-data source
// -----------------------------------------------------------------------------
//
// @brief  fetch(key) → Result<Stock>, delivered through a completion callback.
//
// @details
// The provider is an out-of-process service with its own latency and failure
// profile. Every call is fallible and may be slow, so the interface is
// asynchronous: fetch() returns immediately and `on_complete` runs later.
//
// Completion contract:
//   - on_complete is invoked exactly once per fetch() call.
//   - on_complete runs on the REQUEST LOOP. Implementations that do their
//     I/O elsewhere (ZmqDataProvider) post the completion back to the loop.
//     Implementations that can answer immediately (MockDataProvider) may
//     invoke it synchronously from inside fetch().
//   - Failures are reported as Error{ProviderFailure, ...}, never thrown.
//
// The time between fetch() and on_complete is a suspension point. Other
// requests run during it; callers re-read any state they depend on inside
// on_complete.
// -----------------------------------------------------------------------------
class IDataProvider {
 public:
  using FetchCallback = std::function<void(Result<domain::Stock>)>;

  virtual ~IDataProvider() = default;

  virtual void fetch(const std::string& key, FetchCallback on_complete) = 0;
};

}  // namespace relay
