#pragma once

#include "costbasis/domain/date.hpp"
#include "costbasis/domain/transaction.hpp"

#include <map>
#include <string>
#include <vector>

namespace costbasis {
namespace domain {

// -----------------------------------------------------------------------------
// Holding: open position valued at average cost
// -----------------------------------------------------------------------------
//
// @brief  Quantity and aggregate cost basis of one symbol that is still open
//         after replaying the transaction stream.
//
// @details
// Derived data with no identity beyond its symbol; it is recomputed from the
// full history on every aggregation run.
//
// cost_basis is the aggregate for the whole quantity, not per share.
// avg_cost = cost_basis / quantity, or 0 when quantity is 0.
//
// Invariant: quantity > kQuantityEpsilon for every Holding returned in
// PortfolioSummary::open_holdings.
// -----------------------------------------------------------------------------
struct Holding {
  std::string symbol;
  double quantity{0.0};
  double cost_basis{0.0};
  double avg_cost{0.0};
};

// -----------------------------------------------------------------------------
// ClosedPosition: one complete open → flat cycle of a symbol
// -----------------------------------------------------------------------------
//
// @brief  Totals for every transaction between the symbol's running quantity
//         leaving zero and returning to (effectively) zero.
//
// @details
//   total_cost_basis  sum of (amount + fees) over acquisitions
//   total_proceeds    sum of (amount - fees) over disposals
//   total_fees        fees of every transaction in the cycle
//   realized_gain     total_proceeds - total_cost_basis
//   holding_period_days = last_sell_date - first_buy_date
//   is_long_term      holding_period_days > 365
//
// A symbol may reopen later; each cycle yields its own ClosedPosition.
// -----------------------------------------------------------------------------
struct ClosedPosition {
  std::string symbol;
  double total_shares_bought{0.0};
  double total_shares_sold{0.0};
  double total_cost_basis{0.0};
  double total_proceeds{0.0};
  double total_fees{0.0};
  double realized_gain{0.0};
  double realized_gain_percent{0.0};  // 0 when total_cost_basis is 0
  Date first_buy_date{};
  Date last_sell_date{};
  int holding_period_days{0};
  bool is_long_term{false};
  std::vector<Transaction> transactions;  // The cycle, in replay order
};

// -----------------------------------------------------------------------------
// PortfolioAnomaly
// -----------------------------------------------------------------------------
// Responsibility: Records input the aggregator tolerated instead of
// rejecting, so callers can surface data-quality problems.
// -----------------------------------------------------------------------------
enum class AnomalyKind {
  OverSell,             // Disposal larger than the quantity held; clamped
  DisposalWithoutHolding,  // Disposal while the running quantity was zero
};

struct PortfolioAnomaly {
  std::string transaction_id;
  std::string symbol;
  AnomalyKind kind{AnomalyKind::OverSell};
  double requested_quantity{0.0};
  double held_quantity{0.0};
};

// -----------------------------------------------------------------------------
// PortfolioSummary: output of the holding aggregator
// -----------------------------------------------------------------------------
// open_holdings is keyed by normalized symbol; std::map keeps iteration order
// deterministic for serialization and tests.
// -----------------------------------------------------------------------------
struct PortfolioSummary {
  std::map<std::string, Holding> open_holdings;
  std::vector<ClosedPosition> closed_positions;
  double total_realized_gain{0.0};
  double total_realized_gain_long_term{0.0};
  double total_realized_gain_short_term{0.0};
  std::vector<PortfolioAnomaly> anomalies;
};

}  // namespace domain
}  // namespace costbasis
