#include "costbasis/report/realized_gain_reporter.hpp"
#include "costbasis/lots/lot_ledger.hpp"
#include "costbasis/tax/wash_sale_detector.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace costbasis {

namespace {

// Acquisitions of `symbol` except those that created the lots in `consumed`.
std::vector<domain::Transaction> replacementCandidates(
    const std::vector<domain::Transaction>& transactions,
    const std::string& symbol,
    const std::unordered_set<std::string>& consumed_tx_ids) {
  std::vector<domain::Transaction> out;
  for (const auto& tx : transactions) {
    if (domain::isAcquisition(tx.type) &&
        domain::normalizeSymbol(tx.symbol) == symbol &&
        consumed_tx_ids.count(tx.id) == 0) {
      out.push_back(tx);
    }
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// calculateRealizedGains
// -----------------------------------------------------------------------------
domain::RealizedGainReport calculateRealizedGains(
    const std::vector<domain::Transaction>& transactions,
    domain::Date range_start, domain::Date range_end) {
  domain::RealizedGainReport report;
  report.range_start = range_start;
  report.range_end = range_end;

  const LotLedger ledger =
      replayTaxLots(transactions, domain::CostBasisMethod::Fifo);

  std::unordered_map<std::string, const domain::TaxLot*> lots_by_id;
  for (const auto& lot : ledger.lots) {
    lots_by_id.emplace(lot.id, &lot);
  }

  for (const auto& sale : ledger.sales) {
    const domain::Transaction& tx = sale.transaction;
    if (tx.date < range_start || tx.date > range_end) {
      continue;
    }

    std::unordered_set<std::string> consumed_tx_ids;
    double shares_sold = 0.0;

    for (const auto& alloc : sale.result.allocations) {
      domain::RealizedGainDetail detail;
      detail.symbol = tx.symbol;
      detail.sale_transaction_id = tx.id;
      detail.lot_id = alloc.lot_id;
      detail.sale_date = tx.date;
      detail.acquisition_date = alloc.acquired_date;
      detail.holding_days = alloc.holding_days;
      detail.is_long_term = alloc.is_long_term;
      detail.shares_sold = alloc.quantity_sold;
      detail.proceeds = alloc.proceeds;
      detail.cost_basis = alloc.cost_basis_allocated;
      detail.gain = alloc.gain_loss;
      detail.gain_percent =
          detail.cost_basis > 0.0 ? (detail.gain / detail.cost_basis) * 100.0
                                  : 0.0;
      report.gains.push_back(std::move(detail));

      shares_sold += alloc.quantity_sold;
      auto lot = lots_by_id.find(alloc.lot_id);
      if (lot != lots_by_id.end()) {
        consumed_tx_ids.insert(lot->second->transaction_id);
      }
    }

    // --- Wash-sale annotation of net-loss sales ----------------------------
    if (sale.result.total_gain_loss < 0.0 && shares_sold > 0.0) {
      auto result = detectWashSale(
          tx.date, tx.symbol, sale.result.total_gain_loss, shares_sold,
          replacementCandidates(transactions, tx.symbol, consumed_tx_ids));
      if (result.is_wash_sale) {
        domain::SaleWashSale entry;
        entry.sale_transaction_id = tx.id;
        entry.symbol = tx.symbol;
        entry.sale_date = tx.date;
        entry.sale_gain_loss = sale.result.total_gain_loss;
        entry.result = std::move(result);
        report.wash_sales.push_back(std::move(entry));
      }
    }
  }

  std::stable_sort(report.gains.begin(), report.gains.end(),
                   [](const domain::RealizedGainDetail& a,
                      const domain::RealizedGainDetail& b) {
                     return a.sale_date < b.sale_date;
                   });

  report.summary = summarizeRealizedGains(report.gains);
  for (const auto& ws : report.wash_sales) {
    report.summary.total_disallowed_loss += ws.result.disallowed_loss;
  }
  return report;
}

// -----------------------------------------------------------------------------
// summarizeRealizedGains
// -----------------------------------------------------------------------------
domain::RealizedGainSummary summarizeRealizedGains(
    const std::vector<domain::RealizedGainDetail>& gains) {
  domain::RealizedGainSummary s;
  for (const auto& g : gains) {
    s.total_gain += g.gain;
    s.total_proceeds += g.proceeds;
    s.total_cost_basis += g.cost_basis;
    if (g.is_long_term) {
      s.long_term_gain += g.gain;
      s.long_term_proceeds += g.proceeds;
      s.long_term_cost_basis += g.cost_basis;
      ++s.long_term_count;
    } else {
      s.short_term_gain += g.gain;
      s.short_term_proceeds += g.proceeds;
      s.short_term_cost_basis += g.cost_basis;
      ++s.short_term_count;
    }
  }
  s.total_transactions = gains.size();
  return s;
}

// -----------------------------------------------------------------------------
// calculateUnrealizedGains
// -----------------------------------------------------------------------------
domain::UnrealizedSummary calculateUnrealizedGains(
    const std::map<std::string, domain::Holding>& holdings,
    const IPriceSource& prices, std::optional<domain::Date> as_of) {
  domain::UnrealizedSummary summary;

  for (const auto& [symbol, holding] : holdings) {
    std::optional<double> price;
    if (as_of) {
      price = prices.priceOn(symbol, *as_of);
    }
    if (!price) {
      price = prices.currentPrice(symbol);
    }

    domain::UnrealizedPosition pos;
    pos.symbol = symbol;
    pos.quantity = holding.quantity;
    pos.cost_basis = holding.cost_basis;
    pos.has_market_price = price.has_value();
    pos.price = price.value_or(holding.avg_cost);
    pos.market_value = pos.has_market_price ? pos.quantity * pos.price
                                            : holding.cost_basis;
    pos.unrealized_gain = pos.market_value - pos.cost_basis;
    pos.unrealized_gain_percent =
        pos.cost_basis > 0.0 ? (pos.unrealized_gain / pos.cost_basis) * 100.0
                             : 0.0;

    summary.total_market_value += pos.market_value;
    summary.total_cost_basis += pos.cost_basis;
    summary.total_unrealized_gain += pos.unrealized_gain;
    summary.positions.push_back(std::move(pos));
  }

  std::stable_sort(summary.positions.begin(), summary.positions.end(),
                   [](const domain::UnrealizedPosition& a,
                      const domain::UnrealizedPosition& b) {
                     return a.market_value > b.market_value;
                   });
  return summary;
}

}  // namespace costbasis
