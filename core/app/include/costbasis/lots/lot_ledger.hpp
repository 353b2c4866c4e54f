#pragma once

#include "costbasis/domain/tax_lot.hpp"
#include "costbasis/domain/transaction.hpp"

#include <map>
#include <string>
#include <vector>

namespace costbasis {

// One disposal as replayed by the ledger.
struct LedgerSale {
  domain::Transaction transaction;
  domain::SellResult result;
  double unallocated_qty{0.0};  // Shares no lot could cover (over-sell)
};

// -----------------------------------------------------------------------------
// LotLedger: tax lots after replaying a transaction history
// -----------------------------------------------------------------------------
// lots keeps creation order (acquisition replay order). Depleted lots stay in
// the list with remaining_qty == 0 so their history remains inspectable.
// -----------------------------------------------------------------------------
struct LotLedger {
  std::vector<domain::TaxLot> lots;
  std::vector<LedgerSale> sales;
};

// Sell transaction id → ordered lot ids, for SpecId replays.
using SpecificLotSelections = std::map<std::string, std::vector<std::string>>;

// Lot id assigned to the lot created by an acquisition: "LOT-<transaction id>".
std::string lotIdFor(const domain::Transaction& acquisition);

// -------------------------------------------------------------------------
// replayTaxLots(transactions, method, selections)
// -------------------------------------------------------------------------
//
// @brief  Rebuilds every tax lot from scratch and depletes it sale by sale.
//
// @details
// Transactions are stable-sorted by date. Each Buy/TransferIn creates one
// lot (cost basis amount + fees). Each Sell/TransferOut is allocated with
// allocateSell() against the lots of its symbol that exist at that point,
// and the allocation is committed immediately so later sales see the
// reduced remaining_qty. Dividends are skipped.
//
// After every transaction the remaining_qty of a symbol's lots sums to the
// open quantity the holding aggregator reports for it (within
// kQuantityEpsilon).
//
// @throws std::invalid_argument for SpecId when a disposal has no entry in
//         `selections`.
// -------------------------------------------------------------------------
LotLedger replayTaxLots(const std::vector<domain::Transaction>& transactions,
                        domain::CostBasisMethod method,
                        const SpecificLotSelections& selections = {});

}  // namespace costbasis
