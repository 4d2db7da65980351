#pragma once

#include "relay/cache/i_data_provider.hpp"
#include "relay/cache/mock_data_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace relay {
namespace testing {

// -----------------------------------------------------------------------------
// ScriptedDataProvider: test double that holds every fetch until told
// -----------------------------------------------------------------------------
// fetch() only records the callback. The test then decides when and how each
// request completes (succeed / fail), which makes the suspension point of
// the async provider explicit: state may change between fetch() and the
// completion, exactly as it does with the real provider.
// -----------------------------------------------------------------------------
class ScriptedDataProvider final : public IDataProvider {
 public:
  void fetch(const std::string& key, FetchCallback on_complete) override {
    ++fetch_count_;
    pending_[key].push_back(std::move(on_complete));
  }

  // Completes the oldest pending request for `key` with a generated stock.
  // Returns false when nothing was pending.
  bool succeed(const std::string& key, std::int64_t now_ms,
               double price = 0.0) {
    domain::Stock stock = generateMockStock(key, now_ms);
    if (price > 0.0) {
      stock.current_price = price;
    }
    return complete(key, std::move(stock));
  }

  bool fail(const std::string& key, const std::string& message = "upstream") {
    return complete(key, makeError(ErrorCode::ProviderFailure, message));
  }

  std::size_t pendingFor(const std::string& key) const {
    auto it = pending_.find(key);
    return it == pending_.end() ? 0 : it->second.size();
  }

  std::size_t pendingTotal() const {
    std::size_t total = 0;
    for (const auto& [key, callbacks] : pending_) total += callbacks.size();
    return total;
  }

  std::size_t fetchCount() const { return fetch_count_; }

 private:
  bool complete(const std::string& key, Result<domain::Stock> result) {
    auto it = pending_.find(key);
    if (it == pending_.end() || it->second.empty()) {
      return false;
    }
    FetchCallback callback = std::move(it->second.front());
    it->second.erase(it->second.begin());
    if (it->second.empty()) {
      pending_.erase(it);
    }
    callback(std::move(result));
    return true;
  }

  std::map<std::string, std::vector<FetchCallback>> pending_;
  std::size_t fetch_count_{0};
};

}  // namespace testing
}  // namespace relay
