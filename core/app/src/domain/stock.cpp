#include "relay/domain/stock.hpp"

#include <nlohmann/json.hpp>

namespace relay {
namespace domain {

// -----------------------------------------------------------------------------
// StockPrice
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const StockPrice& p) {
  j = nlohmann::json{{"timestamp", p.timestamp_ms},
                     {"price", p.price},
                     {"volume", p.volume},
                     {"high", p.high},
                     {"low", p.low},
                     {"open", p.open},
                     {"close", p.close}};
}

void from_json(const nlohmann::json& j, StockPrice& p) {
  j.at("timestamp").get_to(p.timestamp_ms);
  j.at("price").get_to(p.price);
  j.at("volume").get_to(p.volume);
  j.at("high").get_to(p.high);
  j.at("low").get_to(p.low);
  j.at("open").get_to(p.open);
  j.at("close").get_to(p.close);
}

// -----------------------------------------------------------------------------
// StockMetrics
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const StockMetrics& m) {
  j = nlohmann::json{{"market_cap", m.market_cap},
                     {"pe_ratio", m.pe_ratio},
                     {"eps", m.eps},
                     {"debt_equity_ratio", m.debt_equity_ratio},
                     {"business_growth", m.business_growth},
                     {"industry_avg_pe", m.industry_avg_pe},
                     {"outstanding_shares", m.outstanding_shares},
                     {"volatility", m.volatility}};
}

void from_json(const nlohmann::json& j, StockMetrics& m) {
  j.at("market_cap").get_to(m.market_cap);
  j.at("pe_ratio").get_to(m.pe_ratio);
  j.at("eps").get_to(m.eps);
  j.at("debt_equity_ratio").get_to(m.debt_equity_ratio);
  j.at("business_growth").get_to(m.business_growth);
  j.at("industry_avg_pe").get_to(m.industry_avg_pe);
  j.at("outstanding_shares").get_to(m.outstanding_shares);
  j.at("volatility").get_to(m.volatility);
}

// -----------------------------------------------------------------------------
// Stock
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Stock& s) {
  j = nlohmann::json{{"id", s.id},
                     {"name", s.name},
                     {"symbol", s.symbol},
                     {"current_price", s.current_price},
                     {"price_history", s.price_history},
                     {"metrics", s.metrics},
                     {"news", s.news},
                     {"last_update", s.last_update_ms}};
}

void from_json(const nlohmann::json& j, Stock& s) {
  j.at("id").get_to(s.id);
  j.at("name").get_to(s.name);
  j.at("symbol").get_to(s.symbol);
  j.at("current_price").get_to(s.current_price);
  j.at("price_history").get_to(s.price_history);
  j.at("metrics").get_to(s.metrics);
  // News is optional on the wire; providers without a news feed omit it.
  s.news = j.value("news", std::vector<std::string>{});
  j.at("last_update").get_to(s.last_update_ms);
}

}  // namespace domain
}  // namespace relay
