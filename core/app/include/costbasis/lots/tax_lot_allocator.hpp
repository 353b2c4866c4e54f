#pragma once

#include "costbasis/domain/date.hpp"
#include "costbasis/domain/tax_lot.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace costbasis {

// -----------------------------------------------------------------------------
// TaxLotAllocator: assigns the shares of one sale to specific tax lots
// -----------------------------------------------------------------------------
//
// @brief  Free functions that order lots by a cost-basis method and split a
//         sale across them, producing per-lot cost basis, proceeds and
//         long/short-term gain.
//
// @details
// Allocation is a two-phase protocol:
//
//   1. allocateSell() / previewSellAllocation() compute a SellResult from a
//      snapshot of lots. They never modify the lots they are given, so a
//      caller can preview several methods against the same snapshot.
//   2. commitSell() applies a chosen SellResult by decrementing the
//      remaining_qty of the touched lots.
//
// Only lots with remaining_qty > 0 take part. When the available lots cannot
// cover the requested quantity the allocation stops early; the shortfall is
// visible as sum(quantity_sold) < sell_qty (allocateSell) or explicitly via
// SellPreview::insufficient_shares (previewSellAllocation).
//
// Error policy:
//   Invalid configuration (SpecId without lot ids) throws
//   std::invalid_argument. Expected conditions (not enough shares, zero-cost
//   lots) are reported in the result.
//
// Thread model:
//   Pure functions over value snapshots. No shared state.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// sortLotsByMethod(lots, method)
// -------------------------------------------------------------------------
// @brief  Returns a copy of `lots` ordered for depletion.
//
// @details
//   Fifo    ascending acquired_date
//   Lifo    descending acquired_date
//   Hifo    descending cost per share
//   SpecId  unchanged input order
//
// All orderings are stable: lots that tie keep their input order.
// -------------------------------------------------------------------------
std::vector<domain::TaxLot> sortLotsByMethod(std::vector<domain::TaxLot> lots,
                                             domain::CostBasisMethod method);

// -------------------------------------------------------------------------
// validateAllocationRequest(method, specific_lot_ids)
// -------------------------------------------------------------------------
// @throws std::invalid_argument for SpecId with an empty id list.
// -------------------------------------------------------------------------
void validateAllocationRequest(
    domain::CostBasisMethod method,
    const std::vector<std::string>& specific_lot_ids);

// -------------------------------------------------------------------------
// allocateSell(lots, sell_qty, sell_price, sell_date, method, ids)
// -------------------------------------------------------------------------
//
// @brief  Splits a sale of `sell_qty` shares at `sell_price` across lots.
//
// @param  lots              Snapshot of the symbol's lots. Not modified.
// @param  specific_lot_ids  SpecId only: ordered lot ids to use. Ids that
//                           are unknown or fully depleted are skipped.
//
// @details
// Walks the ordered candidates and takes min(remaining, lot.remaining_qty)
// from each until nothing remains. For each touched lot:
//
//   cost_basis_allocated = quantity_sold * costPerShare(lot)
//   proceeds             = quantity_sold * sell_price
//   holding_days         = days_between(lot.acquired_date, sell_date)
//   is_long_term         = holding_days > 365
//
// @throws std::invalid_argument via validateAllocationRequest().
// -------------------------------------------------------------------------
domain::SellResult allocateSell(
    const std::vector<domain::TaxLot>& lots, double sell_qty,
    double sell_price, domain::Date sell_date,
    domain::CostBasisMethod method,
    const std::vector<std::string>& specific_lot_ids = {});

// -------------------------------------------------------------------------
// previewSellAllocation(...)
// -------------------------------------------------------------------------
// @brief  allocateSell() plus an availability report for the UI.
//
// @details
// available_quantity is the sum of remaining_qty over every lot with
// remaining_qty > 0, regardless of method. insufficient_shares is set when
// sell_qty exceeds it by more than kQuantityEpsilon.
// -------------------------------------------------------------------------
domain::SellPreview previewSellAllocation(
    const std::vector<domain::TaxLot>& lots, double sell_qty,
    double sell_price, domain::Date sell_date,
    domain::CostBasisMethod method,
    const std::vector<std::string>& specific_lot_ids = {});

// -------------------------------------------------------------------------
// commitSell(lots, result)
// -------------------------------------------------------------------------
// @brief  Applies an allocation: decrements remaining_qty of each lot named
//         in result.allocations, flooring at 0.
//
// @details
// Allocations whose lot id is not present in `lots` are ignored. Lots are
// matched by id, so the vector may be in any order.
// -------------------------------------------------------------------------
void commitSell(std::vector<domain::TaxLot>& lots,
                const domain::SellResult& result);

// Lots of `symbol` (normalized) that still have shares.
std::vector<domain::TaxLot> getAvailableLots(
    const std::vector<domain::TaxLot>& lots, std::string_view symbol);

// Sum of remaining_qty over lots with remaining_qty > 0.
double getTotalAvailableQty(const std::vector<domain::TaxLot>& lots);

// -------------------------------------------------------------------------
// getWeightedAvgCost(lots)
// -------------------------------------------------------------------------
// @brief  Cost per share of the remaining shares, each lot weighted by its
//         remaining_qty. 0 when no shares remain.
// -------------------------------------------------------------------------
double getWeightedAvgCost(const std::vector<domain::TaxLot>& lots);

// Display name, e.g. "First In, First Out (FIFO)".
const char* costBasisMethodName(domain::CostBasisMethod method);

// One-line description, e.g. "Sells oldest shares first".
const char* costBasisMethodDescription(domain::CostBasisMethod method);

// Wire name: "FIFO", "LIFO", "HIFO" or "SPECID".
const char* costBasisMethodToString(domain::CostBasisMethod method);

// Case-insensitive inverse of costBasisMethodToString; also accepts
// "SPECIFIC" and "SPEC_ID". std::nullopt for anything else.
std::optional<domain::CostBasisMethod> parseCostBasisMethod(
    std::string_view text);

}  // namespace costbasis
