#include "relay/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace relay {

namespace {

// Copies j[key] into `field` when present. get_to() keeps the field's type,
// so a string where a number belongs throws type_error. get_to() would wrap
// a negative or fractional number into an unsigned field, so those throw
// std::out_of_range here.
template <typename T>
void overrideField(const nlohmann::json& j, const char* key, T& field) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T> &&
                !std::is_same_v<T, bool>) {
    if (it->is_number() && !it->is_number_unsigned()) {
      throw std::out_of_range(std::string(key) +
                              " must be a non-negative integer");
    }
  }
  it->get_to(field);
}

}  // namespace

Result<domain::BrokerConfig> loadConfigFromString(const std::string& text) {
  domain::BrokerConfig config;

  try {
    auto j = nlohmann::json::parse(text);
    if (!j.is_object()) {
      return makeError(ErrorCode::InvalidInput,
                       "config root must be a JSON object");
    }

    overrideField(j, "max_connections_per_room",
                  config.max_connections_per_room);
    overrideField(j, "max_buffer_size_per_room",
                  config.max_buffer_size_per_room);
    overrideField(j, "connection_timeout_ms", config.connection_timeout_ms);
    overrideField(j, "max_event_age_ms", config.max_event_age_ms);
    overrideField(j, "cleanup_interval_ms", config.cleanup_interval_ms);
    overrideField(j, "retry_hint_ms", config.retry_hint_ms);

    overrideField(j, "stock_room_prefix", config.stock_room_prefix);
    overrideField(j, "stock_room_buffer_size", config.stock_room_buffer_size);
    overrideField(j, "market_room_id", config.market_room_id);

    overrideField(j, "cache_duration_ms", config.cache_duration_ms);
    overrideField(j, "rate_limit_interval_ms", config.rate_limit_interval_ms);
    overrideField(j, "max_access_count_per_period",
                  config.max_access_count_per_period);

    overrideField(j, "summary_ttl_ms", config.summary_ttl_ms);
    overrideField(j, "summary_refresh_interval_ms",
                  config.summary_refresh_interval_ms);
    overrideField(j, "activity_window_ms", config.activity_window_ms);
    overrideField(j, "tracked_symbols", config.tracked_symbols);

    overrideField(j, "price_history_capacity", config.price_history_capacity);
    overrideField(j, "price_snapshot_interval_ms",
                  config.price_snapshot_interval_ms);

    overrideField(j, "access_tokens", config.access_tokens);

    overrideField(j, "command_endpoint", config.command_endpoint);
    overrideField(j, "stream_endpoint", config.stream_endpoint);
    overrideField(j, "provider_endpoint", config.provider_endpoint);
    overrideField(j, "provider_timeout_ms", config.provider_timeout_ms);
  } catch (const nlohmann::json::exception& e) {
    return makeError(ErrorCode::InvalidInput,
                     std::string("invalid config: ") + e.what());
  } catch (const std::out_of_range& e) {
    return makeError(ErrorCode::InvalidInput,
                     std::string("invalid config: ") + e.what());
  }

  if (config.cleanup_interval_ms <= 0 ||
      config.summary_refresh_interval_ms <= 0 ||
      config.price_snapshot_interval_ms <= 0) {
    return makeError(ErrorCode::InvalidInput,
                     "timer intervals must be positive");
  }
  return config;
}

Result<domain::BrokerConfig> loadConfigFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return makeError(ErrorCode::InvalidInput,
                     "cannot open config file " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return loadConfigFromString(buffer.str());
}

}  // namespace relay
