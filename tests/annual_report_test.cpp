// =============================================================================
// annual_report_test.cpp
// =============================================================================
// Unit tests for costbasis::buildAnnualReport and calculateYearStatistics.
//
// Validates:
//   - Activity counts only the transactions dated inside the year
//   - Beginning holdings come from history through the prior year-end and are
//     valued at that date; ending holdings at the year-end
//   - Realized gains cover January 1 through December 31 inclusive
// =============================================================================

#include "costbasis/pricing/static_price_source.hpp"
#include "costbasis/report/annual_report.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using costbasis::domain::Date;
using costbasis::domain::Transaction;
using costbasis::domain::TransactionType;

static Date d(const char* iso) { return *costbasis::domain::parse_iso_date(iso); }

static Transaction makeTx(const std::string& id, const std::string& symbol,
                          TransactionType type, double qty, double price,
                          const char* date, double amount = -1.0) {
  Transaction tx;
  tx.id = id;
  tx.symbol = symbol;
  tx.type = type;
  tx.quantity = qty;
  tx.price = price;
  tx.amount = amount >= 0.0 ? amount : qty * price;
  tx.date = d(date);
  return tx;
}

static std::vector<Transaction> history() {
  return {
      makeTx("b1", "AAPL", TransactionType::Buy, 10, 100, "2022-05-01"),
      makeTx("b2", "AAPL", TransactionType::Buy, 5, 120, "2023-02-01"),
      makeTx("dv", "AAPL", TransactionType::Dividend, 0, 0, "2023-03-15", 12.5),
      makeTx("t1", "MSFT", TransactionType::TransferIn, 4, 250, "2023-04-01"),
      makeTx("s1", "AAPL", TransactionType::Sell, 8, 150, "2023-12-31"),
      makeTx("s2", "AAPL", TransactionType::Sell, 1, 160, "2024-01-01"),
  };
}

TEST(AnnualReportTest, YearStatisticsCountOnlyTheYear) {
  const auto stats = costbasis::calculateYearStatistics(
      history(), d("2023-01-01"), d("2023-12-31"));

  EXPECT_EQ(stats.transaction_count, 4u);
  EXPECT_EQ(stats.buy_count, 1u);
  EXPECT_EQ(stats.sell_count, 1u);
  EXPECT_DOUBLE_EQ(stats.total_bought, 600.0);
  EXPECT_DOUBLE_EQ(stats.total_sold, 1200.0);
  EXPECT_DOUBLE_EQ(stats.dividend_income, 12.5);
}

TEST(AnnualReportTest, BeginningAndEndingHoldings) {
  costbasis::StaticPriceSource prices;
  prices.setClosingPrice("AAPL", d("2022-12-30"), 110.0);
  prices.setClosingPrice("AAPL", d("2023-12-29"), 140.0);
  prices.setCurrentPrice("MSFT", 300.0);

  const auto report = costbasis::buildAnnualReport(history(), 2023, prices);

  EXPECT_EQ(report.year, 2023);

  // 2022-12-31: 10 AAPL at 100, valued at the 2022-12-30 close.
  ASSERT_EQ(report.beginning_holdings.positions.size(), 1u);
  const auto& begin = report.beginning_holdings.positions.front();
  EXPECT_EQ(begin.symbol, "AAPL");
  EXPECT_DOUBLE_EQ(begin.quantity, 10.0);
  EXPECT_DOUBLE_EQ(begin.price, 110.0);
  EXPECT_DOUBLE_EQ(begin.market_value, 1100.0);

  // 2023-12-31: 7 AAPL left after the sale, 4 MSFT from the transfer.
  ASSERT_EQ(report.ending_holdings.positions.size(), 2u);
  const auto& end_msft = report.ending_holdings.positions[0];
  EXPECT_EQ(end_msft.symbol, "MSFT");
  EXPECT_DOUBLE_EQ(end_msft.market_value, 1200.0);
  const auto& aapl = report.ending_holdings.positions[1];
  EXPECT_EQ(aapl.symbol, "AAPL");
  EXPECT_DOUBLE_EQ(aapl.quantity, 7.0);
  EXPECT_DOUBLE_EQ(aapl.price, 140.0);
  EXPECT_NEAR(aapl.market_value, 980.0, 1e-9);
}

TEST(AnnualReportTest, RealizedGainsCoverTheCalendarYear) {
  costbasis::StaticPriceSource prices;

  const auto report = costbasis::buildAnnualReport(history(), 2023, prices);

  EXPECT_EQ(report.realized.range_start, d("2023-01-01"));
  EXPECT_EQ(report.realized.range_end, d("2023-12-31"));

  // s1 on 2023-12-31 is in; s2 on 2024-01-01 is not. FIFO: 8 shares of b1.
  ASSERT_EQ(report.realized.gains.size(), 1u);
  EXPECT_EQ(report.realized.gains.front().sale_transaction_id, "s1");
  EXPECT_DOUBLE_EQ(report.realized.summary.total_gain, 400.0);
  EXPECT_TRUE(report.realized.gains.front().is_long_term);
}

TEST(AnnualReportTest, EmptyYear) {
  costbasis::StaticPriceSource prices;

  const auto report = costbasis::buildAnnualReport({}, 2020, prices);

  EXPECT_EQ(report.statistics.transaction_count, 0u);
  EXPECT_TRUE(report.beginning_holdings.positions.empty());
  EXPECT_TRUE(report.ending_holdings.positions.empty());
  EXPECT_TRUE(report.realized.gains.empty());
}
