#pragma once

#include "costbasis/domain/date.hpp"
#include "costbasis/domain/transaction.hpp"
#include "costbasis/domain/wash_sale.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace costbasis {

// -----------------------------------------------------------------------------
// WashSaleDetector
// -----------------------------------------------------------------------------
//
// @brief  Flags loss sales that are offset by a replacement acquisition of
//         the same symbol within 30 days before or after the sale, and
//         computes how much of the loss is disallowed.
//
// @details
// The window is inclusive on both ends: days_between(sale, buy) <= 30
// qualifies, 31 does not. Same-day buys qualify.
//
// Only Buy and TransferIn count as replacement acquisitions. Gains are
// never wash sales. Symbols are compared after normalizeSymbol().
//
// Only the single best replacement is reported: acquisitions after the sale
// win over acquisitions before it, then the closest to the sale date wins,
// then input order. The disallowed amount is prorated to the shares that
// replacement covers.
//
// Thread model:
//   Pure functions. No shared state.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// detectWashSale(sell_date, symbol, sell_loss, sell_qty, transactions)
// -------------------------------------------------------------------------
//
// @param  sell_loss     Realized gain/loss of the sale; only values < 0 are
//                       examined.
// @param  sell_qty      Shares sold; a non-positive value yields no wash sale.
// @param  transactions  Candidate history in any order. The sale itself may
//                       be included; disposals are ignored.
//
// @return For a match:
//           disallowed_loss  = |sell_loss| * min(buy_qty, sell_qty) / sell_qty
//           matching_buy_qty = min(buy_qty, sell_qty)
//           days_from_sell   = signed days from the sale to the buy
// -------------------------------------------------------------------------
domain::WashSaleResult detectWashSale(
    domain::Date sell_date, std::string_view symbol, double sell_loss,
    double sell_qty, const std::vector<domain::Transaction>& transactions);

// -------------------------------------------------------------------------
// wouldTriggerWashSale(buy_date, symbol, recent_sells, gain_loss_by_sell_id)
// -------------------------------------------------------------------------
//
// @brief  Pre-trade check: which recorded loss sales would a buy on
//         `buy_date` turn into wash sales?
//
// @details
// A sell is affected when it is a Sell/TransferOut of the same symbol within
// the window and gain_loss_by_sell_id records a negative value for its id.
// Sells missing from the map count as 0 (not a loss).
// -------------------------------------------------------------------------
domain::WashSaleExposure wouldTriggerWashSale(
    domain::Date buy_date, std::string_view symbol,
    const std::vector<domain::Transaction>& recent_sells,
    const std::map<std::string, double>& gain_loss_by_sell_id);

// Every transaction of `symbol` (any type) within the window around
// `center`, in input order.
std::vector<domain::Transaction> getTransactionsInWashSaleWindow(
    domain::Date center, std::string_view symbol,
    const std::vector<domain::Transaction>& transactions);

// -------------------------------------------------------------------------
// formatWashSaleWarning(result)
// -------------------------------------------------------------------------
// @return "" for a non-wash result, otherwise e.g.
//         "Wash Sale: $400.00 loss disallowed due to purchase of 50 shares
//          10 days after this sale."
//         A same-day replacement reads "0 days before".
// -------------------------------------------------------------------------
std::string formatWashSaleWarning(const domain::WashSaleResult& result);

// Outcome of screening a sell at entry time.
struct SellScreening {
  double average_cost{0.0};          // Σ amount / Σ quantity of acquisitions
  double estimated_cost_basis{0.0};  // average_cost * sell quantity
  double estimated_gain_loss{0.0};   // sell amount - estimated_cost_basis
  domain::WashSaleResult wash_sale;
};

// -------------------------------------------------------------------------
// screenSellForWashSale(sell, history)
// -------------------------------------------------------------------------
//
// @brief  Estimates a new sale's gain/loss from the average acquisition cost
//         of its symbol in `history`, and runs detectWashSale() when the
//         estimate is a loss.
//
// @details
// This is the quick check done when a sell is entered, before lots are
// assigned; it uses gross amounts (no fees). A `sell` that is not a
// disposal screens as non-wash.
// -------------------------------------------------------------------------
SellScreening screenSellForWashSale(
    const domain::Transaction& sell,
    const std::vector<domain::Transaction>& history);

}  // namespace costbasis
