#include "costbasis/lots/lot_ledger.hpp"
#include "costbasis/lots/tax_lot_allocator.hpp"
#include "costbasis/domain/holding_period.hpp"

#include <algorithm>
#include <stdexcept>

namespace costbasis {

std::string lotIdFor(const domain::Transaction& acquisition) {
  return "LOT-" + acquisition.id;
}

// -----------------------------------------------------------------------------
// replayTaxLots
// -----------------------------------------------------------------------------
LotLedger replayTaxLots(const std::vector<domain::Transaction>& transactions,
                        domain::CostBasisMethod method,
                        const SpecificLotSelections& selections) {
  LotLedger ledger;
  static const std::vector<std::string> kNoSelection;

  for (domain::Transaction tx : domain::sortByDate(transactions)) {
    tx.symbol = domain::normalizeSymbol(tx.symbol);

    using T = domain::TransactionType;
    switch (tx.type) {
      case T::Buy:
      case T::TransferIn: {
        domain::TaxLot lot;
        lot.id = lotIdFor(tx);
        lot.transaction_id = tx.id;
        lot.symbol = tx.symbol;
        lot.quantity = tx.quantity;
        lot.remaining_qty = tx.quantity;
        lot.cost_basis = tx.amount + tx.fees;
        lot.acquired_date = tx.date;
        ledger.lots.push_back(std::move(lot));
        break;
      }

      case T::Sell:
      case T::TransferOut: {
        const std::vector<std::string>* ids = &kNoSelection;
        if (method == domain::CostBasisMethod::SpecId) {
          auto it = selections.find(tx.id);
          if (it == selections.end()) {
            throw std::invalid_argument(
                "SPECID replay has no lot selection for sale " + tx.id);
          }
          ids = &it->second;
        }

        LedgerSale sale;
        sale.result =
            allocateSell(getAvailableLots(ledger.lots, tx.symbol), tx.quantity,
                         tx.price, tx.date, method, *ids);
        commitSell(ledger.lots, sale.result);

        double allocated = 0.0;
        for (const auto& alloc : sale.result.allocations) {
          allocated += alloc.quantity_sold;
        }
        const double uncovered = tx.quantity - allocated;
        sale.unallocated_qty =
            uncovered > domain::kQuantityEpsilon ? uncovered : 0.0;
        sale.transaction = std::move(tx);
        ledger.sales.push_back(std::move(sale));
        break;
      }

      case T::Dividend:
        break;
    }
  }

  return ledger;
}

}  // namespace costbasis
