#pragma once

#include "costbasis/domain/date.hpp"

#include <optional>
#include <string>

namespace costbasis {

// -----------------------------------------------------------------------------
// IPriceSource: quote lookups used to value open holdings
// -----------------------------------------------------------------------------
//
// @brief  Read-only view over market prices supplied by an external quote
//         service.
//
// @details
// The engine never fetches quotes itself. Whoever owns the quote feed
// implements this interface (or fills a StaticPriceSource) and hands it to
// the reporter.
//
// A missing or non-positive price is returned as std::nullopt. Callers then
// fall back to the holding's average cost; they never treat a missing quote
// as a zero price.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads.
// -----------------------------------------------------------------------------
class IPriceSource {
 public:
  virtual ~IPriceSource() = default;

  // Latest known price of `symbol`.
  virtual std::optional<double> currentPrice(const std::string& symbol) const = 0;

  // Closing price of `symbol` on `date`, or the last close before it.
  virtual std::optional<double> priceOn(const std::string& symbol,
                                        domain::Date date) const = 0;
};

}  // namespace costbasis
