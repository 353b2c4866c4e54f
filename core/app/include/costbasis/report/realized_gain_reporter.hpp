#pragma once

#include "costbasis/domain/date.hpp"
#include "costbasis/domain/holding.hpp"
#include "costbasis/domain/realized_gain.hpp"
#include "costbasis/domain/transaction.hpp"
#include "costbasis/pricing/i_price_source.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace costbasis {

// -----------------------------------------------------------------------------
// RealizedGainReporter
// -----------------------------------------------------------------------------
//
// @brief  Produces lot-level realized gains for a date range, with
//         long/short-term totals and wash-sale annotations.
//
// @details
// The whole history is replayed through the lot ledger with FIFO ordering,
// because lots opened and partly consumed before the range still determine
// which cost basis a sale inside the range uses. Only disposals dated inside
// [range_start, range_end] (inclusive) emit details.
//
// One RealizedGainDetail is emitted per lot a sale touched:
//   proceeds   = shares_sold * sale price
//   cost_basis = shares_sold * lot cost per share (fees included)
//   gain_percent is 0 when cost_basis is 0.
//
// Wash sales: each in-range sale with a net loss is checked against the
// acquisitions of its symbol, excluding the acquisitions whose lots that
// sale itself consumed. Matches are listed in wash_sales and summed into
// summary.total_disallowed_loss; gains are left unadjusted.
//
// Thread model:
//   Pure functions. No shared state.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// calculateRealizedGains(transactions, range_start, range_end)
// -------------------------------------------------------------------------
// @param  transactions  Full history, any order, any symbols.
//
// @return Details ordered by sale date (stable), their summary, and the
//         wash-sale annotations of loss sales in range.
// -------------------------------------------------------------------------
domain::RealizedGainReport calculateRealizedGains(
    const std::vector<domain::Transaction>& transactions,
    domain::Date range_start, domain::Date range_end);

// Totals, long/short-term split and counts of a detail list.
// total_disallowed_loss is left at 0.
domain::RealizedGainSummary summarizeRealizedGains(
    const std::vector<domain::RealizedGainDetail>& gains);

// -------------------------------------------------------------------------
// calculateUnrealizedGains(holdings, prices, as_of)
// -------------------------------------------------------------------------
//
// @brief  Values open holdings and reports their paper gain.
//
// @param  as_of  When set, the close on that day is tried first. Otherwise,
//                or if it is missing, the current price is used.
//
// @details
// A holding without any price is valued at its average cost and flagged
// has_market_price = false (market value equals cost basis, gain 0).
// Positions are ordered by market value, largest first.
// -------------------------------------------------------------------------
domain::UnrealizedSummary calculateUnrealizedGains(
    const std::map<std::string, domain::Holding>& holdings,
    const IPriceSource& prices,
    std::optional<domain::Date> as_of = std::nullopt);

}  // namespace costbasis
