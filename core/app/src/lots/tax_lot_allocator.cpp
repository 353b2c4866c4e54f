#include "costbasis/lots/tax_lot_allocator.hpp"
#include "costbasis/domain/holding_period.hpp"
#include "costbasis/domain/transaction.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace costbasis {

namespace {

// Lots in depletion order, restricted to those with shares left. For SpecId
// this is the listed ids, in list order, each used at most once.
std::vector<domain::TaxLot> orderedCandidates(
    const std::vector<domain::TaxLot>& lots, domain::CostBasisMethod method,
    const std::vector<std::string>& specific_lot_ids) {
  std::vector<domain::TaxLot> available;
  for (const auto& lot : lots) {
    if (lot.remaining_qty > domain::kQuantityEpsilon) {
      available.push_back(lot);
    }
  }

  if (method != domain::CostBasisMethod::SpecId) {
    return sortLotsByMethod(std::move(available), method);
  }

  std::vector<domain::TaxLot> selected;
  std::unordered_set<std::string> used;
  for (const auto& id : specific_lot_ids) {
    if (!used.insert(id).second) {
      continue;
    }
    auto it = std::find_if(available.begin(), available.end(),
                           [&id](const domain::TaxLot& l) { return l.id == id; });
    if (it != available.end()) {
      selected.push_back(*it);
    }
  }
  return selected;
}

}  // namespace

// -----------------------------------------------------------------------------
// sortLotsByMethod
// -----------------------------------------------------------------------------
std::vector<domain::TaxLot> sortLotsByMethod(std::vector<domain::TaxLot> lots,
                                             domain::CostBasisMethod method) {
  using M = domain::CostBasisMethod;
  switch (method) {
    case M::Fifo:
      std::stable_sort(lots.begin(), lots.end(),
                       [](const domain::TaxLot& a, const domain::TaxLot& b) {
                         return a.acquired_date < b.acquired_date;
                       });
      break;
    case M::Lifo:
      std::stable_sort(lots.begin(), lots.end(),
                       [](const domain::TaxLot& a, const domain::TaxLot& b) {
                         return a.acquired_date > b.acquired_date;
                       });
      break;
    case M::Hifo:
      std::stable_sort(lots.begin(), lots.end(),
                       [](const domain::TaxLot& a, const domain::TaxLot& b) {
                         return domain::costPerShare(a) >
                                domain::costPerShare(b);
                       });
      break;
    case M::SpecId:
      break;
  }
  return lots;
}

// -----------------------------------------------------------------------------
// validateAllocationRequest
// -----------------------------------------------------------------------------
void validateAllocationRequest(
    domain::CostBasisMethod method,
    const std::vector<std::string>& specific_lot_ids) {
  if (method == domain::CostBasisMethod::SpecId && specific_lot_ids.empty()) {
    throw std::invalid_argument(
        "SPECID allocation requires at least one lot id");
  }
}

// -----------------------------------------------------------------------------
// allocateSell
// -----------------------------------------------------------------------------
domain::SellResult allocateSell(
    const std::vector<domain::TaxLot>& lots, double sell_qty,
    double sell_price, domain::Date sell_date,
    domain::CostBasisMethod method,
    const std::vector<std::string>& specific_lot_ids) {
  validateAllocationRequest(method, specific_lot_ids);

  domain::SellResult result;
  double remaining = sell_qty;

  for (const auto& lot : orderedCandidates(lots, method, specific_lot_ids)) {
    if (remaining <= domain::kQuantityEpsilon) {
      break;
    }

    const double qty = std::min(remaining, lot.remaining_qty);

    domain::SellAllocation alloc;
    alloc.lot_id = lot.id;
    alloc.quantity_sold = qty;
    alloc.cost_basis_allocated = qty * domain::costPerShare(lot);
    alloc.acquired_date = lot.acquired_date;
    alloc.proceeds = qty * sell_price;
    alloc.gain_loss = alloc.proceeds - alloc.cost_basis_allocated;
    alloc.holding_days = domain::days_between(lot.acquired_date, sell_date);
    alloc.is_long_term = domain::isLongTermHolding(alloc.holding_days);

    result.total_cost_basis += alloc.cost_basis_allocated;
    result.total_proceeds += alloc.proceeds;
    if (alloc.is_long_term) {
      result.long_term_gain += alloc.gain_loss;
    } else {
      result.short_term_gain += alloc.gain_loss;
    }

    result.allocations.push_back(std::move(alloc));
    remaining -= qty;
  }

  result.total_gain_loss = result.total_proceeds - result.total_cost_basis;
  return result;
}

// -----------------------------------------------------------------------------
// previewSellAllocation
// -----------------------------------------------------------------------------
domain::SellPreview previewSellAllocation(
    const std::vector<domain::TaxLot>& lots, double sell_qty,
    double sell_price, domain::Date sell_date,
    domain::CostBasisMethod method,
    const std::vector<std::string>& specific_lot_ids) {
  domain::SellPreview preview;
  preview.result = allocateSell(lots, sell_qty, sell_price, sell_date, method,
                                specific_lot_ids);
  preview.available_quantity = getTotalAvailableQty(lots);
  preview.shortfall = std::max(0.0, sell_qty - preview.available_quantity);
  preview.insufficient_shares = preview.shortfall > domain::kQuantityEpsilon;
  return preview;
}

// -----------------------------------------------------------------------------
// commitSell
// -----------------------------------------------------------------------------
void commitSell(std::vector<domain::TaxLot>& lots,
                const domain::SellResult& result) {
  for (const auto& alloc : result.allocations) {
    auto it = std::find_if(
        lots.begin(), lots.end(),
        [&alloc](const domain::TaxLot& l) { return l.id == alloc.lot_id; });
    if (it == lots.end()) {
      continue;
    }
    const double left = it->remaining_qty - alloc.quantity_sold;
    // Subtraction residue below the epsilon depletes the lot.
    it->remaining_qty = left > domain::kQuantityEpsilon ? left : 0.0;
  }
}

// -----------------------------------------------------------------------------
// getAvailableLots / getTotalAvailableQty / getWeightedAvgCost
// -----------------------------------------------------------------------------
std::vector<domain::TaxLot> getAvailableLots(
    const std::vector<domain::TaxLot>& lots, std::string_view symbol) {
  const std::string key = domain::normalizeSymbol(symbol);
  std::vector<domain::TaxLot> out;
  for (const auto& lot : lots) {
    if (lot.remaining_qty > domain::kQuantityEpsilon &&
        domain::normalizeSymbol(lot.symbol) == key) {
      out.push_back(lot);
    }
  }
  return out;
}

double getTotalAvailableQty(const std::vector<domain::TaxLot>& lots) {
  double total = 0.0;
  for (const auto& lot : lots) {
    if (lot.remaining_qty > domain::kQuantityEpsilon) {
      total += lot.remaining_qty;
    }
  }
  return total;
}

double getWeightedAvgCost(const std::vector<domain::TaxLot>& lots) {
  double shares = 0.0;
  double cost = 0.0;
  for (const auto& lot : lots) {
    if (lot.remaining_qty > domain::kQuantityEpsilon) {
      shares += lot.remaining_qty;
      cost += lot.remaining_qty * domain::costPerShare(lot);
    }
  }
  return shares > 0.0 ? cost / shares : 0.0;
}

// -----------------------------------------------------------------------------
// Method names
// -----------------------------------------------------------------------------
const char* costBasisMethodName(domain::CostBasisMethod method) {
  using M = domain::CostBasisMethod;
  switch (method) {
    case M::Fifo:   return "First In, First Out (FIFO)";
    case M::Lifo:   return "Last In, First Out (LIFO)";
    case M::Hifo:   return "Highest Cost First (HIFO)";
    case M::SpecId: return "Specific Identification";
  }
  return "Unknown";
}

const char* costBasisMethodDescription(domain::CostBasisMethod method) {
  using M = domain::CostBasisMethod;
  switch (method) {
    case M::Fifo:   return "Sells oldest shares first";
    case M::Lifo:   return "Sells newest shares first";
    case M::Hifo:   return "Sells highest-cost shares first to minimize taxable gains";
    case M::SpecId: return "Choose specific lots to sell";
  }
  return "";
}

const char* costBasisMethodToString(domain::CostBasisMethod method) {
  using M = domain::CostBasisMethod;
  switch (method) {
    case M::Fifo:   return "FIFO";
    case M::Lifo:   return "LIFO";
    case M::Hifo:   return "HIFO";
    case M::SpecId: return "SPECID";
  }
  return "UNKNOWN";
}

std::optional<domain::CostBasisMethod> parseCostBasisMethod(
    std::string_view text) {
  const std::string key = domain::normalizeSymbol(text);
  using M = domain::CostBasisMethod;

  if (key == "FIFO") {
    return M::Fifo;
  }
  if (key == "LIFO") {
    return M::Lifo;
  }
  if (key == "HIFO") {
    return M::Hifo;
  }
  if (key == "SPECID" || key == "SPEC_ID" || key == "SPECIFIC") {
    return M::SpecId;
  }
  return std::nullopt;
}

}  // namespace costbasis
