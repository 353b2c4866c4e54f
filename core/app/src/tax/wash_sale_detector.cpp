#include "costbasis/tax/wash_sale_detector.hpp"
#include "costbasis/domain/holding_period.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace costbasis {

namespace {

bool withinWindow(domain::Date a, domain::Date b) {
  return domain::days_between(a, b) <= domain::kWashSaleWindowDays;
}

}  // namespace

// -----------------------------------------------------------------------------
// detectWashSale
// -----------------------------------------------------------------------------
domain::WashSaleResult detectWashSale(
    domain::Date sell_date, std::string_view symbol, double sell_loss,
    double sell_qty, const std::vector<domain::Transaction>& transactions) {
  domain::WashSaleResult result;
  if (sell_loss >= 0.0 || sell_qty <= 0.0) {
    return result;
  }

  const std::string key = domain::normalizeSymbol(symbol);

  std::vector<const domain::Transaction*> candidates;
  for (const auto& tx : transactions) {
    if (domain::isAcquisition(tx.type) &&
        domain::normalizeSymbol(tx.symbol) == key &&
        withinWindow(sell_date, tx.date)) {
      candidates.push_back(&tx);
    }
  }

  if (candidates.empty()) {
    return result;
  }

  // Replacements after the sale first, then nearest to the sale.
  std::stable_sort(
      candidates.begin(), candidates.end(),
      [sell_date](const domain::Transaction* a, const domain::Transaction* b) {
        const bool a_after = a->date > sell_date;
        const bool b_after = b->date > sell_date;
        if (a_after != b_after) {
          return a_after;
        }
        return domain::days_between(a->date, sell_date) <
               domain::days_between(b->date, sell_date);
      });

  const domain::Transaction& buy = *candidates.front();
  const double replaced = std::min(buy.quantity, sell_qty);

  result.is_wash_sale = true;
  result.disallowed_loss = std::abs(sell_loss) * (replaced / sell_qty);
  result.matching_buy_id = buy.id;
  result.matching_buy_date = buy.date;
  result.matching_buy_qty = replaced;
  result.days_from_sell = domain::signed_days(sell_date, buy.date);
  return result;
}

// -----------------------------------------------------------------------------
// wouldTriggerWashSale
// -----------------------------------------------------------------------------
domain::WashSaleExposure wouldTriggerWashSale(
    domain::Date buy_date, std::string_view symbol,
    const std::vector<domain::Transaction>& recent_sells,
    const std::map<std::string, double>& gain_loss_by_sell_id) {
  domain::WashSaleExposure exposure;
  const std::string key = domain::normalizeSymbol(symbol);

  for (const auto& sell : recent_sells) {
    if (!domain::isDisposal(sell.type) ||
        domain::normalizeSymbol(sell.symbol) != key ||
        !withinWindow(buy_date, sell.date)) {
      continue;
    }

    auto it = gain_loss_by_sell_id.find(sell.id);
    if (it != gain_loss_by_sell_id.end() && it->second < 0.0) {
      exposure.affected_sell_ids.push_back(sell.id);
    }
  }

  exposure.would_trigger = !exposure.affected_sell_ids.empty();
  return exposure;
}

// -----------------------------------------------------------------------------
// getTransactionsInWashSaleWindow
// -----------------------------------------------------------------------------
std::vector<domain::Transaction> getTransactionsInWashSaleWindow(
    domain::Date center, std::string_view symbol,
    const std::vector<domain::Transaction>& transactions) {
  const std::string key = domain::normalizeSymbol(symbol);
  std::vector<domain::Transaction> out;
  for (const auto& tx : transactions) {
    if (domain::normalizeSymbol(tx.symbol) == key &&
        withinWindow(center, tx.date)) {
      out.push_back(tx);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// formatWashSaleWarning
// -----------------------------------------------------------------------------
std::string formatWashSaleWarning(const domain::WashSaleResult& result) {
  if (!result.is_wash_sale) {
    return {};
  }

  const int days = result.days_from_sell.value_or(0);

  std::ostringstream out;
  out << "Wash Sale: $" << std::fixed << std::setprecision(2)
      << result.disallowed_loss << " loss disallowed due to purchase of ";
  out.unsetf(std::ios_base::floatfield);
  out << std::setprecision(6) << result.matching_buy_qty.value_or(0.0)
      << " shares " << std::abs(days) << " days "
      << (days > 0 ? "after" : "before") << " this sale.";
  return out.str();
}

// -----------------------------------------------------------------------------
// screenSellForWashSale
// -----------------------------------------------------------------------------
SellScreening screenSellForWashSale(
    const domain::Transaction& sell,
    const std::vector<domain::Transaction>& history) {
  SellScreening screening;
  if (!domain::isDisposal(sell.type)) {
    return screening;
  }

  const std::string key = domain::normalizeSymbol(sell.symbol);
  double total_cost = 0.0;
  double total_bought = 0.0;
  for (const auto& tx : history) {
    if (domain::isAcquisition(tx.type) &&
        domain::normalizeSymbol(tx.symbol) == key) {
      total_cost += tx.amount;
      total_bought += tx.quantity;
    }
  }

  screening.average_cost = total_bought > 0.0 ? total_cost / total_bought : 0.0;
  screening.estimated_cost_basis = screening.average_cost * sell.quantity;
  screening.estimated_gain_loss = sell.amount - screening.estimated_cost_basis;

  if (screening.estimated_gain_loss < 0.0) {
    screening.wash_sale = detectWashSale(sell.date, sell.symbol,
                                         screening.estimated_gain_loss,
                                         sell.quantity, history);
  }
  return screening;
}

}  // namespace costbasis
