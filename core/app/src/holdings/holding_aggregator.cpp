#include "costbasis/holdings/holding_aggregator.hpp"
#include "costbasis/domain/holding_period.hpp"

#include <algorithm>
#include <map>

namespace costbasis {

namespace {

// Running state of one symbol between two flat points.
struct Accumulator {
  double quantity{0.0};
  double cost_basis{0.0};
  std::vector<domain::Transaction> transactions;
};

// Average-cost proration of one disposal. Returns the anomaly to record, if
// the disposal could not be applied as given.
std::optional<domain::AnomalyKind> applyDisposal(Accumulator& acc,
                                                 double sell_qty) {
  if (acc.quantity <= 0.0) {
    return domain::AnomalyKind::DisposalWithoutHolding;
  }

  const double ratio = std::min(sell_qty / acc.quantity, 1.0);
  const bool oversold = sell_qty > acc.quantity + domain::kQuantityEpsilon;

  acc.cost_basis -= acc.cost_basis * ratio;
  acc.quantity = std::max(acc.quantity - sell_qty, 0.0);

  if (oversold) {
    return domain::AnomalyKind::OverSell;
  }
  return std::nullopt;
}

}  // namespace

// -----------------------------------------------------------------------------
// calculatePortfolio
// -----------------------------------------------------------------------------
domain::PortfolioSummary calculatePortfolio(
    const std::vector<domain::Transaction>& transactions) {
  domain::PortfolioSummary summary;
  std::map<std::string, Accumulator> accumulators;

  for (domain::Transaction tx : domain::sortByDate(transactions)) {
    tx.symbol = domain::normalizeSymbol(tx.symbol);
    Accumulator& acc = accumulators[tx.symbol];
    acc.transactions.push_back(tx);

    using T = domain::TransactionType;
    switch (tx.type) {
      case T::Buy:
      case T::TransferIn:
        acc.quantity += tx.quantity;
        acc.cost_basis += tx.amount + tx.fees;
        break;

      case T::Sell:
      case T::TransferOut: {
        const double held = acc.quantity;
        if (auto anomaly = applyDisposal(acc, tx.quantity)) {
          domain::PortfolioAnomaly record;
          record.transaction_id = tx.id;
          record.symbol = tx.symbol;
          record.kind = *anomaly;
          record.requested_quantity = tx.quantity;
          record.held_quantity = held;
          summary.anomalies.push_back(std::move(record));
        }
        break;
      }

      case T::Dividend:
        break;
    }

    // --- Cycle closed: emit and reset so the symbol can reopen -------------
    if (acc.quantity <= domain::kQuantityEpsilon) {
      if (auto closed = buildClosedPosition(tx.symbol, acc.transactions)) {
        summary.closed_positions.push_back(std::move(*closed));
      }
      acc = Accumulator{};
    }
  }

  for (const auto& [symbol, acc] : accumulators) {
    if (acc.quantity > domain::kQuantityEpsilon) {
      domain::Holding holding;
      holding.symbol = symbol;
      holding.quantity = acc.quantity;
      holding.cost_basis = acc.cost_basis;
      holding.avg_cost = acc.cost_basis / acc.quantity;
      summary.open_holdings.emplace(symbol, std::move(holding));
    }
  }

  for (const auto& cp : summary.closed_positions) {
    summary.total_realized_gain += cp.realized_gain;
    if (cp.is_long_term) {
      summary.total_realized_gain_long_term += cp.realized_gain;
    } else {
      summary.total_realized_gain_short_term += cp.realized_gain;
    }
  }

  return summary;
}

// -----------------------------------------------------------------------------
// buildClosedPosition
// -----------------------------------------------------------------------------
std::optional<domain::ClosedPosition> buildClosedPosition(
    const std::string& symbol,
    const std::vector<domain::Transaction>& cycle) {
  domain::ClosedPosition cp;
  cp.symbol = symbol;

  std::optional<domain::Date> first_buy;
  std::optional<domain::Date> last_sell;

  for (const auto& tx : cycle) {
    cp.total_fees += tx.fees;

    using T = domain::TransactionType;
    switch (tx.type) {
      case T::Buy:
      case T::TransferIn:
        cp.total_shares_bought += tx.quantity;
        cp.total_cost_basis += tx.amount + tx.fees;
        if (!first_buy) {
          first_buy = tx.date;
        }
        break;

      case T::Sell:
      case T::TransferOut:
        cp.total_shares_sold += tx.quantity;
        cp.total_proceeds += tx.amount - tx.fees;
        last_sell = tx.date;
        break;

      case T::Dividend:
        break;
    }
  }

  if (!first_buy || !last_sell) {
    return std::nullopt;
  }

  cp.realized_gain = cp.total_proceeds - cp.total_cost_basis;
  cp.realized_gain_percent =
      cp.total_cost_basis > 0.0
          ? (cp.realized_gain / cp.total_cost_basis) * 100.0
          : 0.0;
  cp.first_buy_date = *first_buy;
  cp.last_sell_date = *last_sell;
  cp.holding_period_days = domain::signed_days(*first_buy, *last_sell);
  cp.is_long_term = domain::isLongTermHolding(cp.holding_period_days);
  cp.transactions = cycle;
  return cp;
}

}  // namespace costbasis
