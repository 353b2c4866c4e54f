#pragma once

#include "costbasis/pricing/i_price_source.hpp"

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>

namespace costbasis {

// -----------------------------------------------------------------------------
// StaticPriceSource: in-memory quote snapshot
// -----------------------------------------------------------------------------
//
// @brief  IPriceSource backed by maps filled from configuration or by the
//         caller.
//
// @details
// Symbols are normalized on both write and read, so "aapl " and "AAPL"
// share one entry.
//
// Historical closes are kept per symbol in a date-ordered map; priceOn()
// returns the latest close on or before the requested day, which covers
// weekends and holidays without the caller having to know the trading
// calendar.
//
// Thread model:
//   Setters take a unique_lock on mutex_; lookups take a shared_lock. The
//   IPC worker reads while the owning thread may refresh quotes.
// -----------------------------------------------------------------------------
class StaticPriceSource final : public IPriceSource {
 public:
  StaticPriceSource() = default;
  explicit StaticPriceSource(const std::map<std::string, double>& current);

  std::optional<double> currentPrice(const std::string& symbol) const override;
  std::optional<double> priceOn(const std::string& symbol,
                                domain::Date date) const override;

  void setCurrentPrice(const std::string& symbol, double price);
  void setClosingPrice(const std::string& symbol, domain::Date date,
                       double price);

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, double> current_;
  std::map<std::string, std::map<std::int32_t, double>> closes_;
};

}  // namespace costbasis
