// =============================================================================
// lot_ledger_test.cpp
// =============================================================================
// Unit tests for costbasis::replayTaxLots.
//
// Validates:
//   - One lot per acquisition, identified as "LOT-<transaction id>"
//   - Lot remaining quantities track the average-cost aggregator after every
//     prefix of the history
//   - Over-sells are recorded as unallocated quantity
//   - SPECID replays use the per-sale selections and require one per sale
// =============================================================================

#include "costbasis/holdings/holding_aggregator.hpp"
#include "costbasis/lots/lot_ledger.hpp"
#include "costbasis/lots/tax_lot_allocator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using costbasis::domain::CostBasisMethod;
using costbasis::domain::Transaction;
using costbasis::domain::TransactionType;

static Transaction makeTx(const std::string& id, const std::string& symbol,
                          TransactionType type, double qty, double price,
                          const char* date) {
  Transaction tx;
  tx.id = id;
  tx.symbol = symbol;
  tx.type = type;
  tx.quantity = qty;
  tx.price = price;
  tx.amount = qty * price;
  tx.date = *costbasis::domain::parse_iso_date(date);
  return tx;
}

static std::vector<Transaction> mixedHistory() {
  return {
      makeTx("b1", "AAPL", TransactionType::Buy, 10, 10, "2023-01-01"),
      makeTx("b2", "MSFT", TransactionType::Buy, 8, 100, "2023-01-15"),
      makeTx("b3", "AAPL", TransactionType::Buy, 10, 20, "2023-06-01"),
      makeTx("s1", "AAPL", TransactionType::Sell, 15, 30, "2024-01-01"),
      makeTx("d1", "AAPL", TransactionType::Dividend, 0, 0, "2024-01-10"),
      makeTx("s2", "MSFT", TransactionType::Sell, 3, 120, "2024-02-01"),
      makeTx("b4", "AAPL", TransactionType::TransferIn, 2, 25, "2024-03-01"),
      makeTx("s3", "AAPL", TransactionType::TransferOut, 1, 28, "2024-04-01"),
  };
}

TEST(LotLedgerTest, OneLotPerAcquisition) {
  const auto ledger =
      costbasis::replayTaxLots(mixedHistory(), CostBasisMethod::Fifo);

  ASSERT_EQ(ledger.lots.size(), 4u);
  EXPECT_EQ(ledger.lots[0].id, "LOT-b1");
  EXPECT_EQ(ledger.lots[0].transaction_id, "b1");
  EXPECT_EQ(ledger.lots[3].id, "LOT-b4");
  EXPECT_EQ(ledger.sales.size(), 3u);
}

TEST(LotLedgerTest, FifoReplayDepletesOldestLots) {
  const auto ledger =
      costbasis::replayTaxLots(mixedHistory(), CostBasisMethod::Fifo);

  // s1 takes all of b1 and 5 of b3; s3 takes 1 more from b3.
  EXPECT_DOUBLE_EQ(ledger.lots[0].remaining_qty, 0.0);
  EXPECT_DOUBLE_EQ(ledger.lots[2].remaining_qty, 4.0);
  EXPECT_DOUBLE_EQ(ledger.lots[3].remaining_qty, 2.0);
  EXPECT_DOUBLE_EQ(ledger.lots[1].remaining_qty, 5.0);

  EXPECT_DOUBLE_EQ(ledger.sales[0].result.total_gain_loss, 250.0);
}

// -----------------------------------------------------------------------------
// Conservation: for every prefix and every method, the remaining shares of a
// symbol's lots equal the aggregator's open quantity.
// -----------------------------------------------------------------------------
TEST(LotLedgerTest, RemainingSharesMatchAggregatorForEveryPrefix) {
  const auto history = mixedHistory();

  for (auto method : {CostBasisMethod::Fifo, CostBasisMethod::Lifo,
                      CostBasisMethod::Hifo}) {
    for (std::size_t n = 1; n <= history.size(); ++n) {
      const std::vector<Transaction> prefix(history.begin(),
                                            history.begin() + n);
      const auto ledger = costbasis::replayTaxLots(prefix, method);
      const auto summary = costbasis::calculatePortfolio(prefix);

      for (const char* symbol : {"AAPL", "MSFT"}) {
        const double lots_qty = costbasis::getTotalAvailableQty(
            costbasis::getAvailableLots(ledger.lots, symbol));
        const auto it = summary.open_holdings.find(symbol);
        const double held =
            it == summary.open_holdings.end() ? 0.0 : it->second.quantity;
        EXPECT_NEAR(lots_qty, held, 1e-9)
            << "method=" << costbasis::costBasisMethodToString(method)
            << " prefix=" << n << " symbol=" << symbol;
      }

      for (const auto& lot : ledger.lots) {
        EXPECT_GE(lot.remaining_qty, 0.0);
        EXPECT_LE(lot.remaining_qty, lot.quantity);
      }
    }
  }
}

TEST(LotLedgerTest, OverSellLeavesUnallocatedQuantity) {
  const std::vector<Transaction> txs = {
      makeTx("b1", "TSLA", TransactionType::Buy, 5, 100, "2023-01-01"),
      makeTx("s1", "TSLA", TransactionType::Sell, 8, 120, "2023-02-01"),
  };

  const auto ledger = costbasis::replayTaxLots(txs, CostBasisMethod::Fifo);

  ASSERT_EQ(ledger.sales.size(), 1u);
  EXPECT_DOUBLE_EQ(ledger.sales[0].unallocated_qty, 3.0);
  EXPECT_DOUBLE_EQ(ledger.lots[0].remaining_qty, 0.0);
}

TEST(LotLedgerTest, SubtractionResidueDepletesLot) {
  const std::vector<Transaction> txs = {
      makeTx("b1", "BTC", TransactionType::Buy, 0.2, 10, "2024-01-02"),
      makeTx("b2", "BTC", TransactionType::Buy, 0.1, 10, "2024-01-03"),
      makeTx("b3", "BTC", TransactionType::Buy, 0.5, 10, "2024-01-04"),
      makeTx("s1", "BTC", TransactionType::Sell, 0.3, 20, "2024-02-01"),
      makeTx("s2", "BTC", TransactionType::Sell, 0.5, 20, "2024-03-01"),
  };

  const auto ledger = costbasis::replayTaxLots(txs, CostBasisMethod::Fifo);

  ASSERT_EQ(ledger.sales.size(), 2u);
  EXPECT_EQ(ledger.sales[0].result.allocations.size(), 2u);
  ASSERT_EQ(ledger.sales[1].result.allocations.size(), 1u);
  EXPECT_EQ(ledger.sales[1].result.allocations[0].lot_id, "LOT-b3");
  EXPECT_DOUBLE_EQ(ledger.sales[1].unallocated_qty, 0.0);

  for (const auto& lot : ledger.lots) {
    EXPECT_DOUBLE_EQ(lot.remaining_qty, 0.0) << lot.id;
  }
}

TEST(LotLedgerTest, SpecIdUsesSelectionPerSale) {
  const std::vector<Transaction> txs = {
      makeTx("b1", "AAPL", TransactionType::Buy, 10, 10, "2023-01-01"),
      makeTx("b2", "AAPL", TransactionType::Buy, 10, 20, "2023-06-01"),
      makeTx("s1", "AAPL", TransactionType::Sell, 4, 30, "2024-01-01"),
  };
  const costbasis::SpecificLotSelections selections = {{"s1", {"LOT-b2"}}};

  const auto ledger =
      costbasis::replayTaxLots(txs, CostBasisMethod::SpecId, selections);

  EXPECT_DOUBLE_EQ(ledger.lots[0].remaining_qty, 10.0);
  EXPECT_DOUBLE_EQ(ledger.lots[1].remaining_qty, 6.0);
  EXPECT_DOUBLE_EQ(ledger.sales[0].result.total_gain_loss, 40.0);
}

TEST(LotLedgerTest, SpecIdWithoutSelectionThrows) {
  const std::vector<Transaction> txs = {
      makeTx("b1", "AAPL", TransactionType::Buy, 10, 10, "2023-01-01"),
      makeTx("s1", "AAPL", TransactionType::Sell, 4, 30, "2024-01-01"),
  };

  EXPECT_THROW(costbasis::replayTaxLots(txs, CostBasisMethod::SpecId),
               std::invalid_argument);
}
