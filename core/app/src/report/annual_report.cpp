#include "costbasis/report/annual_report.hpp"
#include "costbasis/holdings/holding_aggregator.hpp"
#include "costbasis/report/realized_gain_reporter.hpp"

namespace costbasis {

namespace {

std::vector<domain::Transaction> datedOnOrBefore(
    const std::vector<domain::Transaction>& transactions, domain::Date last) {
  std::vector<domain::Transaction> out;
  for (const auto& tx : transactions) {
    if (tx.date <= last) {
      out.push_back(tx);
    }
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// calculateYearStatistics
// -----------------------------------------------------------------------------
domain::YearStatistics calculateYearStatistics(
    const std::vector<domain::Transaction>& transactions, domain::Date start,
    domain::Date end) {
  domain::YearStatistics stats;

  for (const auto& tx : transactions) {
    if (tx.date < start || tx.date > end) {
      continue;
    }
    ++stats.transaction_count;

    using T = domain::TransactionType;
    switch (tx.type) {
      case T::Buy:
        ++stats.buy_count;
        stats.total_bought += tx.amount;
        break;
      case T::Sell:
        ++stats.sell_count;
        stats.total_sold += tx.amount;
        break;
      case T::Dividend:
        stats.dividend_income += tx.amount;
        break;
      case T::TransferIn:
      case T::TransferOut:
        break;
    }
  }
  return stats;
}

// -----------------------------------------------------------------------------
// buildAnnualReport
// -----------------------------------------------------------------------------
domain::AnnualReport buildAnnualReport(
    const std::vector<domain::Transaction>& transactions, int year,
    const IPriceSource& prices) {
  const domain::Date start = domain::make_date(year, 1, 1);
  const domain::Date end = domain::make_date(year, 12, 31);
  const domain::Date prior_year_end{start.days - 1};

  domain::AnnualReport report;
  report.year = year;
  report.statistics = calculateYearStatistics(transactions, start, end);

  const auto beginning =
      calculatePortfolio(datedOnOrBefore(transactions, prior_year_end));
  report.beginning_holdings =
      calculateUnrealizedGains(beginning.open_holdings, prices, prior_year_end);

  const auto ending = calculatePortfolio(datedOnOrBefore(transactions, end));
  report.ending_holdings =
      calculateUnrealizedGains(ending.open_holdings, prices, end);

  report.realized = calculateRealizedGains(transactions, start, end);
  return report;
}

}  // namespace costbasis
