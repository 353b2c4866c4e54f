// =============================================================================
// tax_lot_allocator_test.cpp
// =============================================================================
// Unit tests for the tax-lot allocator.
//
// Validates:
//   - FIFO, LIFO and HIFO depletion order
//   - Partial lot consumption and per-lot holding periods
//   - SPECID uses the listed lots in list order and rejects an empty list
//   - Every method yields the same totals when all lots are consumed
//   - previewSellAllocation reports shortfall without throwing
//   - commitSell never drives remaining_qty below zero
//   - Remainders within 1e-4 shares count as depleted
// =============================================================================

#include "costbasis/lots/tax_lot_allocator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using costbasis::domain::CostBasisMethod;
using costbasis::domain::Date;
using costbasis::domain::TaxLot;

static Date d(const char* iso) { return *costbasis::domain::parse_iso_date(iso); }

static TaxLot makeLot(const std::string& id, double qty, double unit_cost,
                      const char* acquired) {
  TaxLot lot;
  lot.id = id;
  lot.transaction_id = id;
  lot.symbol = "AAPL";
  lot.quantity = qty;
  lot.remaining_qty = qty;
  lot.cost_basis = qty * unit_cost;
  lot.acquired_date = d(acquired);
  return lot;
}

// Lots: 10 @ $10 (2023-01-01), 10 @ $20 (2023-06-01).
static std::vector<TaxLot> twoLots() {
  return {makeLot("L1", 10, 10, "2023-01-01"),
          makeLot("L2", 10, 20, "2023-06-01")};
}

// -----------------------------------------------------------------------------
// 1. FIFO partial: 15 @ $30 on 2024-01-01 takes all of L1 and 5 of L2.
// -----------------------------------------------------------------------------
TEST(TaxLotAllocatorTest, FifoPartialConsumption) {
  const auto result = costbasis::allocateSell(
      twoLots(), 15, 30, d("2024-01-01"), CostBasisMethod::Fifo);

  ASSERT_EQ(result.allocations.size(), 2u);

  const auto& first = result.allocations[0];
  EXPECT_EQ(first.lot_id, "L1");
  EXPECT_DOUBLE_EQ(first.quantity_sold, 10.0);
  EXPECT_DOUBLE_EQ(first.cost_basis_allocated, 100.0);
  EXPECT_EQ(first.holding_days, 365);
  EXPECT_FALSE(first.is_long_term);

  const auto& second = result.allocations[1];
  EXPECT_EQ(second.lot_id, "L2");
  EXPECT_DOUBLE_EQ(second.quantity_sold, 5.0);
  EXPECT_DOUBLE_EQ(second.cost_basis_allocated, 100.0);

  EXPECT_DOUBLE_EQ(result.total_cost_basis, 200.0);
  EXPECT_DOUBLE_EQ(result.total_proceeds, 450.0);
  EXPECT_DOUBLE_EQ(result.total_gain_loss, 250.0);
  EXPECT_DOUBLE_EQ(result.short_term_gain, 250.0);
  EXPECT_DOUBLE_EQ(result.long_term_gain, 0.0);
}

// -----------------------------------------------------------------------------
// 2. Selling 10 @ $30: FIFO gains 200, HIFO gains 100.
// -----------------------------------------------------------------------------
TEST(TaxLotAllocatorTest, HifoMinimizesGainAgainstFifo) {
  const auto fifo = costbasis::allocateSell(twoLots(), 10, 30, d("2024-01-01"),
                                            CostBasisMethod::Fifo);
  const auto hifo = costbasis::allocateSell(twoLots(), 10, 30, d("2024-01-01"),
                                            CostBasisMethod::Hifo);

  EXPECT_DOUBLE_EQ(fifo.total_gain_loss, 200.0);
  EXPECT_DOUBLE_EQ(hifo.total_gain_loss, 100.0);
  ASSERT_EQ(hifo.allocations.size(), 1u);
  EXPECT_EQ(hifo.allocations.front().lot_id, "L2");
}

TEST(TaxLotAllocatorTest, LifoTakesNewestFirst) {
  auto lots = twoLots();
  lots.push_back(makeLot("L3", 10, 15, "2023-09-01"));

  const auto result = costbasis::allocateSell(lots, 12, 25, d("2024-01-01"),
                                              CostBasisMethod::Lifo);

  ASSERT_EQ(result.allocations.size(), 2u);
  EXPECT_EQ(result.allocations[0].lot_id, "L3");
  EXPECT_DOUBLE_EQ(result.allocations[0].quantity_sold, 10.0);
  EXPECT_EQ(result.allocations[1].lot_id, "L2");
  EXPECT_DOUBLE_EQ(result.allocations[1].quantity_sold, 2.0);
}

TEST(TaxLotAllocatorTest, SortIsStableForTies) {
  std::vector<TaxLot> lots = {makeLot("A", 1, 10, "2023-01-01"),
                              makeLot("B", 1, 10, "2023-01-01"),
                              makeLot("C", 1, 10, "2023-01-01")};

  for (auto method : {CostBasisMethod::Fifo, CostBasisMethod::Lifo,
                      CostBasisMethod::Hifo}) {
    const auto sorted = costbasis::sortLotsByMethod(lots, method);
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0].id, "A");
    EXPECT_EQ(sorted[1].id, "B");
    EXPECT_EQ(sorted[2].id, "C");
  }
}

// -----------------------------------------------------------------------------
// 3. SPECID: list order, duplicates and unknown ids skipped.
// -----------------------------------------------------------------------------
TEST(TaxLotAllocatorTest, SpecIdFollowsListOrder) {
  const auto result = costbasis::allocateSell(
      twoLots(), 15, 30, d("2024-01-01"), CostBasisMethod::SpecId,
      {"NOPE", "L2", "L2", "L1"});

  ASSERT_EQ(result.allocations.size(), 2u);
  EXPECT_EQ(result.allocations[0].lot_id, "L2");
  EXPECT_DOUBLE_EQ(result.allocations[0].quantity_sold, 10.0);
  EXPECT_EQ(result.allocations[1].lot_id, "L1");
  EXPECT_DOUBLE_EQ(result.allocations[1].quantity_sold, 5.0);
}

TEST(TaxLotAllocatorTest, SpecIdOnlyUsesListedLots) {
  const auto result = costbasis::allocateSell(
      twoLots(), 15, 30, d("2024-01-01"), CostBasisMethod::SpecId, {"L1"});

  ASSERT_EQ(result.allocations.size(), 1u);
  EXPECT_DOUBLE_EQ(result.allocations.front().quantity_sold, 10.0);
}

TEST(TaxLotAllocatorTest, SpecIdWithoutIdsThrows) {
  EXPECT_THROW(costbasis::allocateSell(twoLots(), 5, 30, d("2024-01-01"),
                                       CostBasisMethod::SpecId),
               std::invalid_argument);
  EXPECT_NO_THROW(costbasis::validateAllocationRequest(CostBasisMethod::Fifo, {}));
}

// -----------------------------------------------------------------------------
// 4. Consuming every lot gives identical totals for every ordering.
// -----------------------------------------------------------------------------
TEST(TaxLotAllocatorTest, MethodsAgreeOnFullConsumption) {
  const auto fifo = costbasis::allocateSell(twoLots(), 20, 30, d("2024-01-01"),
                                            CostBasisMethod::Fifo);
  const auto lifo = costbasis::allocateSell(twoLots(), 20, 30, d("2024-01-01"),
                                            CostBasisMethod::Lifo);
  const auto hifo = costbasis::allocateSell(twoLots(), 20, 30, d("2024-01-01"),
                                            CostBasisMethod::Hifo);

  EXPECT_NEAR(fifo.total_cost_basis, 300.0, 1e-9);
  EXPECT_NEAR(lifo.total_cost_basis, fifo.total_cost_basis, 1e-9);
  EXPECT_NEAR(hifo.total_cost_basis, fifo.total_cost_basis, 1e-9);
  EXPECT_NEAR(lifo.total_gain_loss, fifo.total_gain_loss, 1e-9);
  EXPECT_NEAR(hifo.total_gain_loss, fifo.total_gain_loss, 1e-9);
}

TEST(TaxLotAllocatorTest, DepletedLotsAreSkipped) {
  auto lots = twoLots();
  lots[0].remaining_qty = 0.0;

  const auto result = costbasis::allocateSell(lots, 5, 30, d("2024-01-01"),
                                              CostBasisMethod::Fifo);

  ASSERT_EQ(result.allocations.size(), 1u);
  EXPECT_EQ(result.allocations.front().lot_id, "L2");
}

// -----------------------------------------------------------------------------
// 5. Preview flags a shortfall and still allocates what exists.
// -----------------------------------------------------------------------------
TEST(TaxLotAllocatorTest, PreviewReportsShortfall) {
  const auto preview = costbasis::previewSellAllocation(
      twoLots(), 25, 30, d("2024-01-01"), CostBasisMethod::Fifo);

  EXPECT_TRUE(preview.insufficient_shares);
  EXPECT_DOUBLE_EQ(preview.available_quantity, 20.0);
  EXPECT_DOUBLE_EQ(preview.shortfall, 5.0);
  EXPECT_DOUBLE_EQ(preview.result.total_proceeds, 600.0);
}

TEST(TaxLotAllocatorTest, PreviewWithEnoughShares) {
  const auto preview = costbasis::previewSellAllocation(
      twoLots(), 20, 30, d("2024-01-01"), CostBasisMethod::Hifo);

  EXPECT_FALSE(preview.insufficient_shares);
  EXPECT_DOUBLE_EQ(preview.shortfall, 0.0);
}

// -----------------------------------------------------------------------------
// 6. commitSell decrements by lot id and floors at zero.
// -----------------------------------------------------------------------------
TEST(TaxLotAllocatorTest, CommitSellNeverGoesNegative) {
  auto lots = twoLots();
  const auto result = costbasis::allocateSell(lots, 15, 30, d("2024-01-01"),
                                              CostBasisMethod::Fifo);
  costbasis::commitSell(lots, result);

  EXPECT_DOUBLE_EQ(lots[0].remaining_qty, 0.0);
  EXPECT_DOUBLE_EQ(lots[1].remaining_qty, 5.0);

  // Applying the same allocation again must not underflow.
  costbasis::commitSell(lots, result);
  EXPECT_DOUBLE_EQ(lots[0].remaining_qty, 0.0);
  EXPECT_DOUBLE_EQ(lots[1].remaining_qty, 0.0);
}

TEST(TaxLotAllocatorTest, NearZeroRemainderCountsAsDepleted) {
  auto lots = twoLots();
  lots[0].remaining_qty = 5e-5;

  const auto result = costbasis::allocateSell(lots, 5, 30, d("2024-01-01"),
                                              CostBasisMethod::Fifo);
  ASSERT_EQ(result.allocations.size(), 1u);
  EXPECT_EQ(result.allocations.front().lot_id, "L2");
  EXPECT_EQ(costbasis::getAvailableLots(lots, "AAPL").size(), 1u);
  EXPECT_DOUBLE_EQ(costbasis::getTotalAvailableQty(lots), 10.0);

  // Selling all but 5e-5 of L2 leaves nothing behind.
  auto fresh = twoLots();
  const auto almost = costbasis::allocateSell(
      fresh, 9.99995, 30, d("2024-01-01"), CostBasisMethod::Lifo);
  costbasis::commitSell(fresh, almost);
  EXPECT_DOUBLE_EQ(fresh[1].remaining_qty, 0.0);
  EXPECT_DOUBLE_EQ(fresh[0].remaining_qty, 10.0);
}

// -----------------------------------------------------------------------------
// 7. Lot queries.
// -----------------------------------------------------------------------------
TEST(TaxLotAllocatorTest, AvailableLotsAndWeightedAverage) {
  auto lots = twoLots();
  TaxLot other = makeLot("M1", 5, 100, "2023-02-01");
  other.symbol = "MSFT";
  lots.push_back(other);
  lots[1].remaining_qty = 5.0;

  const auto aapl = costbasis::getAvailableLots(lots, "aapl");
  ASSERT_EQ(aapl.size(), 2u);
  EXPECT_DOUBLE_EQ(costbasis::getTotalAvailableQty(aapl), 15.0);
  // (10 * 10 + 5 * 20) / 15
  EXPECT_NEAR(costbasis::getWeightedAvgCost(aapl), 200.0 / 15.0, 1e-9);

  EXPECT_DOUBLE_EQ(costbasis::getWeightedAvgCost({}), 0.0);
}

TEST(TaxLotAllocatorTest, MethodNamesRoundTrip) {
  for (auto method : {CostBasisMethod::Fifo, CostBasisMethod::Lifo,
                      CostBasisMethod::Hifo, CostBasisMethod::SpecId}) {
    const auto parsed = costbasis::parseCostBasisMethod(
        costbasis::costBasisMethodToString(method));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, method);
  }

  EXPECT_EQ(costbasis::parseCostBasisMethod(" hifo "), CostBasisMethod::Hifo);
  EXPECT_EQ(costbasis::parseCostBasisMethod("spec_id"), CostBasisMethod::SpecId);
  EXPECT_FALSE(costbasis::parseCostBasisMethod("AVERAGE").has_value());
  EXPECT_STREQ(costbasis::costBasisMethodName(CostBasisMethod::Hifo),
               "Highest Cost First (HIFO)");
}
