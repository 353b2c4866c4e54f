#include "costbasis/codec/json_codec.hpp"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace costbasis {
namespace codec {

namespace {

std::string formatFixed(double value, int decimals) {
  // Values that round to zero print as "0.00", never "-0.00".
  const double half_unit = 0.5 / std::pow(10.0, decimals);
  if (std::abs(value) < half_unit) {
    value = 0.0;
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  return buf;
}

std::string formatPercent(double value) { return formatFixed(value, 2); }

const char* anomalyKindToString(domain::AnomalyKind kind) {
  using K = domain::AnomalyKind;
  switch (kind) {
    case K::OverSell:               return "OVER_SELL";
    case K::DisposalWithoutHolding: return "DISPOSAL_WITHOUT_HOLDING";
  }
  return "UNKNOWN";
}

template <typename T>
nlohmann::json arrayOf(const std::vector<T>& items) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& item : items) {
    arr.push_back(toJson(item));
  }
  return arr;
}

}  // namespace

std::string formatMoney(double value) { return formatFixed(value, 2); }

std::string formatQuantity(double value) { return formatFixed(value, 4); }

// -----------------------------------------------------------------------------
// Input
// -----------------------------------------------------------------------------
domain::Date dateFromJson(const nlohmann::json& j, const std::string& key) {
  const auto text = j.at(key).get<std::string>();
  auto date = domain::parse_iso_date(text);
  if (!date) {
    throw std::invalid_argument("Invalid date for '" + key + "': " + text);
  }
  return *date;
}

domain::Transaction transactionFromJson(const nlohmann::json& j) {
  domain::Transaction tx;
  tx.id = j.at("id").get<std::string>();
  tx.symbol = domain::normalizeSymbol(j.at("symbol").get<std::string>());

  const auto type_name = j.at("type").get<std::string>();
  auto type = domain::parseTransactionType(type_name);
  if (!type) {
    throw std::invalid_argument("Unknown transaction type '" + type_name +
                                "' in transaction " + tx.id);
  }
  tx.type = *type;

  tx.quantity = j.at("quantity").get<double>();
  tx.price = j.at("price").get<double>();
  if (tx.quantity < 0.0) {
    throw std::invalid_argument("Negative quantity in transaction " + tx.id);
  }

  tx.amount = j.contains("amount") ? j.at("amount").get<double>()
                                   : tx.quantity * tx.price;
  tx.fees = j.value("fees", 0.0);
  tx.date = dateFromJson(j, "date");
  return tx;
}

std::vector<domain::Transaction> transactionsFromJson(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument("'transactions' must be an array");
  }
  std::vector<domain::Transaction> out;
  out.reserve(j.size());
  for (const auto& item : j) {
    out.push_back(transactionFromJson(item));
  }
  return out;
}

// -----------------------------------------------------------------------------
// Holdings
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Transaction& tx) {
  nlohmann::json j;
  j["id"] = tx.id;
  j["symbol"] = tx.symbol;
  j["type"] = domain::transactionTypeToString(tx.type);
  j["quantity"] = formatQuantity(tx.quantity);
  j["price"] = formatMoney(tx.price);
  j["amount"] = formatMoney(tx.amount);
  j["fees"] = formatMoney(tx.fees);
  j["date"] = domain::to_iso_string(tx.date);
  return j;
}

nlohmann::json toJson(const domain::Holding& holding) {
  nlohmann::json j;
  j["symbol"] = holding.symbol;
  j["quantity"] = formatQuantity(holding.quantity);
  j["cost_basis"] = formatMoney(holding.cost_basis);
  j["avg_cost"] = formatMoney(holding.avg_cost);
  return j;
}

nlohmann::json toJson(const domain::ClosedPosition& cp) {
  nlohmann::json j;
  j["symbol"] = cp.symbol;
  j["total_shares_bought"] = formatQuantity(cp.total_shares_bought);
  j["total_shares_sold"] = formatQuantity(cp.total_shares_sold);
  j["total_cost_basis"] = formatMoney(cp.total_cost_basis);
  j["total_proceeds"] = formatMoney(cp.total_proceeds);
  j["total_fees"] = formatMoney(cp.total_fees);
  j["realized_gain"] = formatMoney(cp.realized_gain);
  j["realized_gain_percent"] = formatPercent(cp.realized_gain_percent);
  j["first_buy_date"] = domain::to_iso_string(cp.first_buy_date);
  j["last_sell_date"] = domain::to_iso_string(cp.last_sell_date);
  j["holding_period_days"] = cp.holding_period_days;
  j["is_long_term"] = cp.is_long_term;
  j["transactions"] = arrayOf(cp.transactions);
  return j;
}

nlohmann::json toJson(const domain::PortfolioAnomaly& anomaly) {
  nlohmann::json j;
  j["transaction_id"] = anomaly.transaction_id;
  j["symbol"] = anomaly.symbol;
  j["kind"] = anomalyKindToString(anomaly.kind);
  j["requested_quantity"] = formatQuantity(anomaly.requested_quantity);
  j["held_quantity"] = formatQuantity(anomaly.held_quantity);
  return j;
}

nlohmann::json toJson(const domain::PortfolioSummary& summary) {
  nlohmann::json holdings = nlohmann::json::array();
  for (const auto& [symbol, holding] : summary.open_holdings) {
    holdings.push_back(toJson(holding));
  }

  nlohmann::json j;
  j["open_holdings"] = std::move(holdings);
  j["closed_positions"] = arrayOf(summary.closed_positions);
  j["total_realized_gain"] = formatMoney(summary.total_realized_gain);
  j["total_realized_gain_long_term"] =
      formatMoney(summary.total_realized_gain_long_term);
  j["total_realized_gain_short_term"] =
      formatMoney(summary.total_realized_gain_short_term);
  j["anomalies"] = arrayOf(summary.anomalies);
  return j;
}

// -----------------------------------------------------------------------------
// Lots
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::TaxLot& lot) {
  nlohmann::json j;
  j["id"] = lot.id;
  j["transaction_id"] = lot.transaction_id;
  j["symbol"] = lot.symbol;
  j["quantity"] = formatQuantity(lot.quantity);
  j["remaining_qty"] = formatQuantity(lot.remaining_qty);
  j["cost_basis"] = formatMoney(lot.cost_basis);
  j["cost_per_share"] = formatMoney(domain::costPerShare(lot));
  j["acquired_date"] = domain::to_iso_string(lot.acquired_date);
  return j;
}

nlohmann::json toJson(const domain::SellAllocation& alloc) {
  nlohmann::json j;
  j["lot_id"] = alloc.lot_id;
  j["quantity_sold"] = formatQuantity(alloc.quantity_sold);
  j["cost_basis_allocated"] = formatMoney(alloc.cost_basis_allocated);
  j["acquired_date"] = domain::to_iso_string(alloc.acquired_date);
  j["proceeds"] = formatMoney(alloc.proceeds);
  j["gain_loss"] = formatMoney(alloc.gain_loss);
  j["is_long_term"] = alloc.is_long_term;
  j["holding_days"] = alloc.holding_days;
  return j;
}

nlohmann::json toJson(const domain::SellResult& result) {
  nlohmann::json j;
  j["allocations"] = arrayOf(result.allocations);
  j["total_cost_basis"] = formatMoney(result.total_cost_basis);
  j["total_proceeds"] = formatMoney(result.total_proceeds);
  j["total_gain_loss"] = formatMoney(result.total_gain_loss);
  j["long_term_gain"] = formatMoney(result.long_term_gain);
  j["short_term_gain"] = formatMoney(result.short_term_gain);
  return j;
}

nlohmann::json toJson(const domain::SellPreview& preview) {
  nlohmann::json j = toJson(preview.result);
  j["available_quantity"] = formatQuantity(preview.available_quantity);
  j["insufficient_shares"] = preview.insufficient_shares;
  j["shortfall"] = formatQuantity(preview.shortfall);
  return j;
}

nlohmann::json toJson(const LotLedger& ledger) {
  nlohmann::json sales = nlohmann::json::array();
  for (const auto& sale : ledger.sales) {
    nlohmann::json s = toJson(sale.result);
    s["transaction"] = toJson(sale.transaction);
    s["unallocated_qty"] = formatQuantity(sale.unallocated_qty);
    sales.push_back(std::move(s));
  }

  nlohmann::json j;
  j["lots"] = arrayOf(ledger.lots);
  j["sales"] = std::move(sales);
  return j;
}

// -----------------------------------------------------------------------------
// Wash sales
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::WashSaleResult& result) {
  nlohmann::json j;
  j["is_wash_sale"] = result.is_wash_sale;
  j["disallowed_loss"] = formatMoney(result.disallowed_loss);
  if (result.matching_buy_id) {
    j["matching_buy_id"] = *result.matching_buy_id;
  }
  if (result.matching_buy_date) {
    j["matching_buy_date"] = domain::to_iso_string(*result.matching_buy_date);
  }
  if (result.matching_buy_qty) {
    j["matching_buy_qty"] = formatQuantity(*result.matching_buy_qty);
  }
  if (result.days_from_sell) {
    j["days_from_sell"] = *result.days_from_sell;
  }
  j["warning"] = formatWashSaleWarning(result);
  return j;
}

nlohmann::json toJson(const domain::WashSaleExposure& exposure) {
  nlohmann::json j;
  j["would_trigger"] = exposure.would_trigger;
  j["affected_sell_ids"] = exposure.affected_sell_ids;
  return j;
}

nlohmann::json toJson(const SellScreening& screening) {
  nlohmann::json j;
  j["average_cost"] = formatMoney(screening.average_cost);
  j["estimated_cost_basis"] = formatMoney(screening.estimated_cost_basis);
  j["estimated_gain_loss"] = formatMoney(screening.estimated_gain_loss);
  j["wash_sale"] = toJson(screening.wash_sale);
  return j;
}

// -----------------------------------------------------------------------------
// Reports
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::RealizedGainDetail& detail) {
  nlohmann::json j;
  j["symbol"] = detail.symbol;
  j["sale_transaction_id"] = detail.sale_transaction_id;
  j["lot_id"] = detail.lot_id;
  j["sale_date"] = domain::to_iso_string(detail.sale_date);
  j["acquisition_date"] = domain::to_iso_string(detail.acquisition_date);
  j["holding_days"] = detail.holding_days;
  j["is_long_term"] = detail.is_long_term;
  j["shares_sold"] = formatQuantity(detail.shares_sold);
  j["proceeds"] = formatMoney(detail.proceeds);
  j["cost_basis"] = formatMoney(detail.cost_basis);
  j["gain"] = formatMoney(detail.gain);
  j["gain_percent"] = formatPercent(detail.gain_percent);
  return j;
}

nlohmann::json toJson(const domain::RealizedGainSummary& s) {
  nlohmann::json j;
  j["total_gain"] = formatMoney(s.total_gain);
  j["total_proceeds"] = formatMoney(s.total_proceeds);
  j["total_cost_basis"] = formatMoney(s.total_cost_basis);
  j["long_term_gain"] = formatMoney(s.long_term_gain);
  j["long_term_proceeds"] = formatMoney(s.long_term_proceeds);
  j["long_term_cost_basis"] = formatMoney(s.long_term_cost_basis);
  j["short_term_gain"] = formatMoney(s.short_term_gain);
  j["short_term_proceeds"] = formatMoney(s.short_term_proceeds);
  j["short_term_cost_basis"] = formatMoney(s.short_term_cost_basis);
  j["total_transactions"] = s.total_transactions;
  j["long_term_count"] = s.long_term_count;
  j["short_term_count"] = s.short_term_count;
  j["total_disallowed_loss"] = formatMoney(s.total_disallowed_loss);
  return j;
}

nlohmann::json toJson(const domain::RealizedGainReport& report) {
  nlohmann::json wash_sales = nlohmann::json::array();
  for (const auto& ws : report.wash_sales) {
    nlohmann::json w = toJson(ws.result);
    w["sale_transaction_id"] = ws.sale_transaction_id;
    w["symbol"] = ws.symbol;
    w["sale_date"] = domain::to_iso_string(ws.sale_date);
    w["sale_gain_loss"] = formatMoney(ws.sale_gain_loss);
    wash_sales.push_back(std::move(w));
  }

  nlohmann::json j;
  j["range_start"] = domain::to_iso_string(report.range_start);
  j["range_end"] = domain::to_iso_string(report.range_end);
  j["gains"] = arrayOf(report.gains);
  j["summary"] = toJson(report.summary);
  j["wash_sales"] = std::move(wash_sales);
  return j;
}

nlohmann::json toJson(const domain::UnrealizedSummary& summary) {
  nlohmann::json positions = nlohmann::json::array();
  for (const auto& p : summary.positions) {
    nlohmann::json row;
    row["symbol"] = p.symbol;
    row["quantity"] = formatQuantity(p.quantity);
    row["cost_basis"] = formatMoney(p.cost_basis);
    row["price"] = formatMoney(p.price);
    row["market_value"] = formatMoney(p.market_value);
    row["unrealized_gain"] = formatMoney(p.unrealized_gain);
    row["unrealized_gain_percent"] = formatPercent(p.unrealized_gain_percent);
    row["has_market_price"] = p.has_market_price;
    positions.push_back(std::move(row));
  }

  nlohmann::json j;
  j["positions"] = std::move(positions);
  j["total_market_value"] = formatMoney(summary.total_market_value);
  j["total_cost_basis"] = formatMoney(summary.total_cost_basis);
  j["total_unrealized_gain"] = formatMoney(summary.total_unrealized_gain);
  return j;
}

nlohmann::json toJson(const domain::YearStatistics& stats) {
  nlohmann::json j;
  j["transaction_count"] = stats.transaction_count;
  j["buy_count"] = stats.buy_count;
  j["sell_count"] = stats.sell_count;
  j["total_bought"] = formatMoney(stats.total_bought);
  j["total_sold"] = formatMoney(stats.total_sold);
  j["dividend_income"] = formatMoney(stats.dividend_income);
  return j;
}

nlohmann::json toJson(const domain::AnnualReport& report) {
  nlohmann::json j;
  j["year"] = report.year;
  j["statistics"] = toJson(report.statistics);
  j["beginning_holdings"] = toJson(report.beginning_holdings);
  j["ending_holdings"] = toJson(report.ending_holdings);
  j["realized"] = toJson(report.realized);
  return j;
}

// -----------------------------------------------------------------------------
// closedPositionExportRow
// -----------------------------------------------------------------------------
nlohmann::json closedPositionExportRow(const domain::ClosedPosition& cp) {
  nlohmann::json j;
  j["symbol"] = cp.symbol;
  j["status"] = "CLOSED";
  j["shares_bought"] = formatQuantity(cp.total_shares_bought);
  j["shares_sold"] = formatQuantity(cp.total_shares_sold);
  j["cost_basis"] = formatMoney(cp.total_cost_basis);
  j["proceeds"] = formatMoney(cp.total_proceeds);
  j["fees"] = formatMoney(cp.total_fees);
  j["realized_gain"] = formatMoney(cp.realized_gain);
  j["realized_gain_percent"] = formatPercent(cp.realized_gain_percent);
  j["first_buy_date"] = domain::to_iso_string(cp.first_buy_date);
  j["last_sell_date"] = domain::to_iso_string(cp.last_sell_date);
  j["holding_period_days"] = cp.holding_period_days;
  j["tax_treatment"] = cp.is_long_term ? "Long-term Capital Gain"
                                       : "Short-term Capital Gain";
  return j;
}

}  // namespace codec
}  // namespace costbasis
