#pragma once

#include "costbasis/domain/date.hpp"

#include <string>
#include <vector>

namespace costbasis {
namespace domain {

// -----------------------------------------------------------------------------
// CostBasisMethod
// -----------------------------------------------------------------------------
// Responsibility: Selects which tax lots a sale depletes first.
//
//   Fifo    oldest acquisition first
//   Lifo    newest acquisition first
//   Hifo    highest cost per share first (minimizes taxable gain)
//   SpecId  caller-supplied ordered list of lot ids; unlisted lots unused
//
// The choice changes realized gain and its long/short-term split for the
// same sale.
// -----------------------------------------------------------------------------
enum class CostBasisMethod {
  Fifo,
  Lifo,
  Hifo,
  SpecId,
};

// -----------------------------------------------------------------------------
// TaxLot
// -----------------------------------------------------------------------------
//
// @brief  One discrete acquisition of shares with its own cost and date.
//
// @details
// Created from a Buy or TransferIn transaction (one lot per acquisition).
//
//   quantity       original quantity acquired; never changes
//   remaining_qty  shares not yet disposed of; only ever decreases
//   cost_basis     cost of the full original quantity (amount + fees)
//
// Invariant: 0 <= remaining_qty <= quantity.
//
// The allocator never touches remaining_qty; depleting it is a separate,
// explicit commit step (see commitSell).
// -----------------------------------------------------------------------------
struct TaxLot {
  std::string id;
  std::string transaction_id;
  std::string symbol;
  double quantity{0.0};
  double remaining_qty{0.0};
  double cost_basis{0.0};
  Date acquired_date{};
};

// Cost per share of a lot; 0 for a zero-quantity lot.
inline double costPerShare(const TaxLot& lot) {
  return lot.quantity > 0.0 ? lot.cost_basis / lot.quantity : 0.0;
}

// -----------------------------------------------------------------------------
// SellAllocation: the part of one sale charged against one lot
// -----------------------------------------------------------------------------
struct SellAllocation {
  std::string lot_id;
  double quantity_sold{0.0};         // <= lot.remaining_qty at allocation time
  double cost_basis_allocated{0.0};  // quantity_sold * costPerShare(lot)
  Date acquired_date{};              // Copied from the lot
  double proceeds{0.0};              // quantity_sold * sell_price
  double gain_loss{0.0};             // proceeds - cost_basis_allocated
  bool is_long_term{false};          // holding_days > 365
  int holding_days{0};
};

// -----------------------------------------------------------------------------
// SellResult: full allocation of one sale
// -----------------------------------------------------------------------------
struct SellResult {
  std::vector<SellAllocation> allocations;
  double total_cost_basis{0.0};
  double total_proceeds{0.0};
  double total_gain_loss{0.0};
  double long_term_gain{0.0};
  double short_term_gain{0.0};
};

// -----------------------------------------------------------------------------
// SellPreview: allocation plus an explicit availability report
// -----------------------------------------------------------------------------
// insufficient_shares and shortfall replace an exception: selling more than
// is available is an expected condition the caller branches on.
// -----------------------------------------------------------------------------
struct SellPreview {
  SellResult result;
  double available_quantity{0.0};
  bool insufficient_shares{false};
  double shortfall{0.0};  // max(0, sell_qty - available_quantity)
};

}  // namespace domain
}  // namespace costbasis
