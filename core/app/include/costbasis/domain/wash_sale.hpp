#pragma once

#include "costbasis/domain/date.hpp"

#include <optional>
#include <string>
#include <vector>

namespace costbasis {
namespace domain {

// -----------------------------------------------------------------------------
// WashSaleResult
// -----------------------------------------------------------------------------
//
// @brief  Outcome of checking one loss sale against the 61-day wash-sale
//         window.
//
// @details
// is_wash_sale is true only for a loss sale with a qualifying replacement
// acquisition. The matching_* fields are populated only in that case.
//
//   disallowed_loss  |loss| * shares_replaced / sell_qty
//   matching_buy_qty shares replaced, min(buy quantity, sell quantity)
//   days_from_sell   signed: negative when the buy preceded the sale
// -----------------------------------------------------------------------------
struct WashSaleResult {
  bool is_wash_sale{false};
  double disallowed_loss{0.0};
  std::optional<std::string> matching_buy_id;
  std::optional<Date> matching_buy_date;
  std::optional<double> matching_buy_qty;
  std::optional<int> days_from_sell;
};

// -----------------------------------------------------------------------------
// WashSaleExposure
// -----------------------------------------------------------------------------
// Result of the pre-trade check: would a proposed buy taint recent loss
// sales? affected_sell_ids keeps the order of the sells passed in.
// -----------------------------------------------------------------------------
struct WashSaleExposure {
  bool would_trigger{false};
  std::vector<std::string> affected_sell_ids;
};

}  // namespace domain
}  // namespace costbasis
