#pragma once

#include "costbasis/domain/holding.hpp"
#include "costbasis/domain/transaction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace costbasis {

// -----------------------------------------------------------------------------
// Holding aggregator: running-balance portfolio at average cost
// -----------------------------------------------------------------------------
//
// @brief  Folds a transaction stream into open holdings and closed positions
//         using average-cost proration on every disposal.
//
// @details
// This is the cheap method behind dashboards and portfolio summaries. It does
// not track lots: a sale of k out of n shares removes k/n of the aggregate
// cost basis regardless of which shares were bought when. Audit-grade
// per-lot results come from the lot ledger and the realized-gain reporter;
// both methods coexist on purpose and are never reconciled against each
// other.
//
// Accumulator rules, per normalized symbol:
//
//   Buy / TransferIn:
//     quantity   += tx.quantity
//     cost_basis += tx.amount + tx.fees
//
//   Sell / TransferOut (with quantity > 0):
//     ratio       = min(tx.quantity / quantity, 1)
//     cost_basis -= cost_basis * ratio
//     quantity    = max(quantity - tx.quantity, 0)
//
//   Dividend:
//     recorded in the cycle's transaction list only.
//
// After each transaction, a quantity <= kQuantityEpsilon closes the cycle:
// a ClosedPosition is derived from the accumulated transactions and the
// accumulator resets so the symbol can reopen later.
//
// Error policy:
//   Over-sells are clamped (the position closes at zero, never negative) and
//   disposals against an empty position are ignored. Both are reported in
//   PortfolioSummary::anomalies rather than thrown.
//
// Thread model:
//   Pure function of its input. Safe to call concurrently on different
//   inputs; no shared state.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// calculatePortfolio(transactions)
// -------------------------------------------------------------------------
// @brief  Replays the transactions (stable-sorted by date) and returns open
//         holdings, closed positions and realized-gain totals.
//
// @param  transactions  Any order; sorted internally. Not modified.
//
// @return PortfolioSummary. total_realized_gain_long_term and
//         total_realized_gain_short_term split the closed positions on
//         ClosedPosition::is_long_term.
// -------------------------------------------------------------------------
domain::PortfolioSummary calculatePortfolio(
    const std::vector<domain::Transaction>& transactions);

// -------------------------------------------------------------------------
// buildClosedPosition(symbol, cycle)
// -------------------------------------------------------------------------
// @brief  Derives the totals of one open → flat cycle.
//
// @return std::nullopt when the cycle has no acquisition or no disposal
//         (e.g. a dividend or a stray sell recorded while flat).
// -------------------------------------------------------------------------
std::optional<domain::ClosedPosition> buildClosedPosition(
    const std::string& symbol,
    const std::vector<domain::Transaction>& cycle);

}  // namespace costbasis
