#pragma once

#include "costbasis/domain/date.hpp"
#include "costbasis/domain/wash_sale.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace costbasis {
namespace domain {

// -----------------------------------------------------------------------------
// RealizedGainDetail: one lot's share of one sale, as reported
// -----------------------------------------------------------------------------
// A sale that spans three lots produces three details with the same
// sale_transaction_id.
// -----------------------------------------------------------------------------
struct RealizedGainDetail {
  std::string symbol;
  std::string sale_transaction_id;
  std::string lot_id;
  Date sale_date{};
  Date acquisition_date{};
  int holding_days{0};
  bool is_long_term{false};
  double shares_sold{0.0};
  double proceeds{0.0};
  double cost_basis{0.0};
  double gain{0.0};
  double gain_percent{0.0};  // 0 when cost_basis is 0
};

// -----------------------------------------------------------------------------
// RealizedGainSummary: aggregate of a list of RealizedGainDetail
// -----------------------------------------------------------------------------
struct RealizedGainSummary {
  double total_gain{0.0};
  double total_proceeds{0.0};
  double total_cost_basis{0.0};

  double long_term_gain{0.0};
  double long_term_proceeds{0.0};
  double long_term_cost_basis{0.0};

  double short_term_gain{0.0};
  double short_term_proceeds{0.0};
  double short_term_cost_basis{0.0};

  std::size_t total_transactions{0};  // Number of details
  std::size_t long_term_count{0};
  std::size_t short_term_count{0};

  double total_disallowed_loss{0.0};  // Sum over SaleWashSale entries
};

// Wash-sale annotation for one in-range loss sale.
struct SaleWashSale {
  std::string sale_transaction_id;
  std::string symbol;
  Date sale_date{};
  double sale_gain_loss{0.0};
  WashSaleResult result;
};

struct RealizedGainReport {
  Date range_start{};
  Date range_end{};
  std::vector<RealizedGainDetail> gains;
  RealizedGainSummary summary;
  std::vector<SaleWashSale> wash_sales;
};

// -----------------------------------------------------------------------------
// UnrealizedPosition / UnrealizedSummary
// -----------------------------------------------------------------------------
//
// @brief  Paper gain of open holdings at a given price.
//
// @details
// When no market price is available the holding is valued at its average
// cost: market_value == cost_basis, unrealized_gain == 0 and
// has_market_price == false. UI layers treat that as "no market data".
// -----------------------------------------------------------------------------
struct UnrealizedPosition {
  std::string symbol;
  double quantity{0.0};
  double cost_basis{0.0};
  double price{0.0};  // Market price, or average cost on fallback
  double market_value{0.0};
  double unrealized_gain{0.0};
  double unrealized_gain_percent{0.0};
  bool has_market_price{false};
};

struct UnrealizedSummary {
  std::vector<UnrealizedPosition> positions;  // Sorted by market_value, desc
  double total_market_value{0.0};
  double total_cost_basis{0.0};
  double total_unrealized_gain{0.0};
};

// -----------------------------------------------------------------------------
// YearStatistics / AnnualReport
// -----------------------------------------------------------------------------
struct YearStatistics {
  std::size_t transaction_count{0};
  std::size_t buy_count{0};
  std::size_t sell_count{0};
  double total_bought{0.0};   // Sum of Buy amounts
  double total_sold{0.0};     // Sum of Sell amounts
  double dividend_income{0.0};
};

struct AnnualReport {
  int year{0};
  YearStatistics statistics;
  UnrealizedSummary beginning_holdings;  // Valued at the prior year-end
  UnrealizedSummary ending_holdings;     // Valued at the year-end
  RealizedGainReport realized;
};

}  // namespace domain
}  // namespace costbasis
