#include "costbasis/pricing/static_price_source.hpp"
#include "costbasis/domain/transaction.hpp"

#include <mutex>

namespace costbasis {

namespace {

std::optional<double> positive(double price) {
  if (price > 0.0) {
    return price;
  }
  return std::nullopt;
}

}  // namespace

StaticPriceSource::StaticPriceSource(
    const std::map<std::string, double>& current) {
  for (const auto& [symbol, price] : current) {
    current_[domain::normalizeSymbol(symbol)] = price;
  }
}

// -----------------------------------------------------------------------------
// currentPrice(): shared_lock lookup
// -----------------------------------------------------------------------------
std::optional<double> StaticPriceSource::currentPrice(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = current_.find(domain::normalizeSymbol(symbol));
  if (it == current_.end()) {
    return std::nullopt;
  }
  return positive(it->second);
}

// -----------------------------------------------------------------------------
// priceOn(): latest close at or before `date`
// -----------------------------------------------------------------------------
std::optional<double> StaticPriceSource::priceOn(const std::string& symbol,
                                                 domain::Date date) const {
  std::shared_lock lock(mutex_);
  auto series = closes_.find(domain::normalizeSymbol(symbol));
  if (series == closes_.end()) {
    return std::nullopt;
  }

  auto it = series->second.upper_bound(date.days);
  if (it == series->second.begin()) {
    return std::nullopt;
  }
  --it;
  return positive(it->second);
}

void StaticPriceSource::setCurrentPrice(const std::string& symbol,
                                        double price) {
  std::unique_lock lock(mutex_);
  current_[domain::normalizeSymbol(symbol)] = price;
}

void StaticPriceSource::setClosingPrice(const std::string& symbol,
                                        domain::Date date, double price) {
  std::unique_lock lock(mutex_);
  closes_[domain::normalizeSymbol(symbol)][date.days] = price;
}

}  // namespace costbasis
