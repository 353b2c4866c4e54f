#pragma once

#include "costbasis/domain/realized_gain.hpp"
#include "costbasis/domain/transaction.hpp"
#include "costbasis/pricing/i_price_source.hpp"

#include <vector>

namespace costbasis {

// -----------------------------------------------------------------------------
// buildAnnualReport(transactions, year, prices)
// -----------------------------------------------------------------------------
//
// @brief  Year-in-review numbers for one calendar year.
//
// @details
//   statistics          Transactions dated in the year: count, Buy/Sell
//                       counts and gross amounts, dividend income.
//                       Transfers count toward transaction_count only.
//   beginning_holdings  Average-cost holdings from transactions before
//                       Jan 1, valued at the Dec 31 close of the prior year.
//   ending_holdings     Holdings from transactions up to Dec 31, valued at
//                       that day's close.
//   realized            calculateRealizedGains() for Jan 1 .. Dec 31.
//
// Valuation falls back to the current price, then to average cost (see
// calculateUnrealizedGains).
// -----------------------------------------------------------------------------
domain::AnnualReport buildAnnualReport(
    const std::vector<domain::Transaction>& transactions, int year,
    const IPriceSource& prices);

// Statistics over the transactions dated in [start, end].
domain::YearStatistics calculateYearStatistics(
    const std::vector<domain::Transaction>& transactions, domain::Date start,
    domain::Date end);

}  // namespace costbasis
