#include "relay/cache/mock_data_provider.hpp"

#include "relay/time/time_utils.hpp"

#include <sstream>
#include <vector>

namespace relay {

namespace {

constexpr std::size_t kHistoryDays = 7;
constexpr double kMaxDailyMove = 0.04;      // Full width of the ±2 % band
constexpr double kIntradayRange = 0.015;
constexpr std::uint64_t kBaseVolume = 50000;

double basePriceFor(const std::string& symbol) {
  if (symbol == "RELIANCE") return 2500.0;
  if (symbol == "TCS") return 3200.0;
  if (symbol == "INFY") return 1450.0;
  if (symbol == "HDFC") return 1680.0;
  if (symbol == "ICICI") return 750.0;
  if (symbol == "SBI") return 520.0;
  if (symbol == "BHARTI") return 820.0;
  if (symbol == "ITC") return 420.0;
  if (symbol == "WIPRO") return 380.0;
  if (symbol == "TECHM") return 1120.0;
  return 1000.0;
}

std::string companyNameFor(const std::string& symbol) {
  if (symbol == "RELIANCE") return "Reliance Industries Ltd";
  if (symbol == "TCS") return "Tata Consultancy Services";
  if (symbol == "INFY") return "Infosys Limited";
  if (symbol == "HDFC") return "HDFC Bank Limited";
  if (symbol == "ICICI") return "ICICI Bank Limited";
  if (symbol == "SBI") return "State Bank of India";
  if (symbol == "BHARTI") return "Bharti Airtel Limited";
  if (symbol == "ITC") return "ITC Limited";
  if (symbol == "WIPRO") return "Wipro Limited";
  if (symbol == "TECHM") return "Tech Mahindra Limited";
  return symbol;
}

domain::StockMetrics metricsFor(const std::string& symbol) {
  if (symbol == "RELIANCE") {
    return {15e12, 12.5, 200.0, 0.45, 8.5, 15.2, 6'000'000'000ULL, 0.25};
  }
  if (symbol == "TCS") {
    return {12e12, 28.5, 112.0, 0.15, 12.3, 25.8, 3'750'000'000ULL, 0.22};
  }
  if (symbol == "INFY") {
    return {6e12, 22.8, 63.5, 0.12, 15.2, 25.8, 4'150'000'000ULL, 0.28};
  }
  return {2e12, 18.5, 54.0, 0.65, 6.8, 20.5, 2'000'000'000ULL, 0.32};
}

std::vector<std::string> headlinesFor(const std::string& name,
                                      double business_growth) {
  std::ostringstream results;
  results << name << " reports strong quarterly results with "
          << business_growth << "% growth";
  return {
      results.str(),
      "Analysts upgrade " + name + " target price citing robust fundamentals",
      name + " announces new strategic initiatives for digital transformation",
  };
}

}  // namespace

domain::Stock generateMockStock(const std::string& symbol,
                                std::int64_t now_ms) {
  domain::Stock stock;
  stock.id = symbol;
  stock.symbol = symbol;
  stock.name = companyNameFor(symbol);
  stock.metrics = metricsFor(symbol);
  stock.news = headlinesFor(stock.name, stock.metrics.business_growth);
  stock.last_update_ms = now_ms;

  double price = basePriceFor(symbol);
  stock.price_history.reserve(kHistoryDays);

  for (std::size_t i = kHistoryDays; i-- > 0;) {
    const std::int64_t timestamp =
        now_ms - static_cast<std::int64_t>(i) * days(1);
    const std::uint64_t ts = static_cast<std::uint64_t>(timestamp);

    const double change = (static_cast<double>(ts % 1000) / 1000.0 - 0.5) *
                          kMaxDailyMove;
    price *= 1.0 + change;

    domain::StockPrice bar;
    bar.timestamp_ms = timestamp;
    bar.price = price;
    bar.volume = kBaseVolume + ts % 100000;
    bar.high = price + price * kIntradayRange;
    bar.low = price - price * kIntradayRange;
    bar.open = stock.price_history.empty() ? price
                                           : stock.price_history.back().close;
    bar.close = price;
    stock.price_history.push_back(bar);
  }

  stock.current_price = stock.price_history.back().close;
  return stock;
}

MockDataProvider::MockDataProvider(const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

void MockDataProvider::fetch(const std::string& key,
                             FetchCallback on_complete) {
  ++fetch_count_;
  on_complete(generateMockStock(key, time_provider_.now_ms()));
}

}  // namespace relay
