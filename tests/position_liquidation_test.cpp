// =============================================================================
// position_liquidation_test.cpp
// =============================================================================
// Sell selection against the profit target, exemption of the reinvestment
// instrument, ledger credit on success and audit rows for every attempt.
// =============================================================================

#include "trader/trading_logic/position_liquidation.hpp"
#include "mocks/trading_test_harness.hpp"

#include <gtest/gtest.h>

using namespace ReinvestTrader;
using ReinvestTrader::Testing::TradingHarness;

class PositionLiquidationTest : public ::testing::Test {
protected:
    TradingHarness harness;

    void SetUp() override {
        harness.brokerage.buying_power = 1000.0;
        harness.build();
    }

    Core::LiquidationResult run_liquidation(Core::ProfitLedger& ledger) {
        Core::PositionLiquidation liquidation(harness.step_params());
        return liquidation.execute(harness.account_manager->fetch_account_snapshot(), ledger);
    }
};

TEST_F(PositionLiquidationTest, SellsFullQuantityAtOrAboveTarget) {
    harness.brokerage.positions = {Core::Position("XYZ", 4.0, 100.0, 106.0)};
    Core::ProfitLedger ledger(0.0);

    auto result = run_liquidation(ledger);

    ASSERT_EQ(harness.brokerage.submitted_orders.size(), 1u);
    const auto& sell_order = harness.brokerage.submitted_orders[0];
    EXPECT_EQ(sell_order.symbol, "XYZ");
    EXPECT_EQ(sell_order.side, Core::OrderSide::SELL);
    ASSERT_TRUE(sell_order.quantity.has_value());
    EXPECT_DOUBLE_EQ(*sell_order.quantity, 4.0);
    EXPECT_FALSE(sell_order.notional.has_value());

    EXPECT_EQ(result.orders_succeeded, 1);
    EXPECT_DOUBLE_EQ(result.realized_proceeds, 424.0);
    EXPECT_DOUBLE_EQ(ledger.get_funds(), 424.0);
}

TEST_F(PositionLiquidationTest, ExactlyAtTargetSells) {
    harness.brokerage.positions = {Core::Position("EDGE", 2.0, 100.0, 105.0)};
    Core::ProfitLedger ledger;

    run_liquidation(ledger);

    EXPECT_EQ(harness.brokerage.count_submitted("EDGE", Core::OrderSide::SELL), 1);
}

TEST_F(PositionLiquidationTest, BelowTargetIsHeld) {
    harness.brokerage.positions = {
        Core::Position("LOW", 10.0, 100.0, 104.99),
        Core::Position("DOWN", 10.0, 100.0, 80.0)
    };
    Core::ProfitLedger ledger;

    auto result = run_liquidation(ledger);

    EXPECT_TRUE(harness.brokerage.submitted_orders.empty());
    EXPECT_EQ(result.positions_scanned, 2);
    EXPECT_TRUE(harness.audit_rows().empty());
}

TEST_F(PositionLiquidationTest, ReinvestmentInstrumentIsNeverSold) {
    harness.brokerage.positions = {Core::Position("VIG", 5.0, 100.0, 250.0)};
    Core::ProfitLedger ledger;

    run_liquidation(ledger);

    EXPECT_TRUE(harness.brokerage.submitted_orders.empty());
}

TEST_F(PositionLiquidationTest, NonPositiveQuantityOrEntryIsSkippedSilently) {
    harness.brokerage.positions = {
        Core::Position("ZERO", 0.0, 100.0, 200.0),
        Core::Position("SHORT", -3.0, 100.0, 200.0),
        Core::Position("FREE", 3.0, 0.0, 200.0)
    };
    Core::ProfitLedger ledger;

    run_liquidation(ledger);

    EXPECT_TRUE(harness.brokerage.submitted_orders.empty());
    EXPECT_TRUE(harness.audit_rows().empty());
}

TEST_F(PositionLiquidationTest, FailedSellIsAuditedAndLeavesLedger) {
    harness.brokerage.positions = {Core::Position("XYZ", 1.0, 10.0, 20.0)};
    harness.brokerage.rejected_symbols["XYZ"] = "insufficient qty available for order";
    Core::ProfitLedger ledger(0.40);

    auto result = run_liquidation(ledger);

    EXPECT_EQ(result.orders_failed, 1);
    EXPECT_DOUBLE_EQ(ledger.get_funds(), 0.40);

    auto audit_rows = harness.audit_rows();
    ASSERT_EQ(audit_rows.size(), 1u);
    EXPECT_EQ(audit_rows[0][1], "XYZ");
    EXPECT_EQ(audit_rows[0][2], "sell");
    EXPECT_EQ(audit_rows[0][3], "");
    EXPECT_EQ(audit_rows[0][4], "20");
    EXPECT_EQ(audit_rows[0][5], "");
    EXPECT_EQ(audit_rows[0][6], "fail");
    EXPECT_EQ(audit_rows[0][7], "insufficient qty available for order");
}

TEST_F(PositionLiquidationTest, SuccessfulSellAuditRowCarriesOrderIdAndPrice) {
    harness.brokerage.positions = {Core::Position("XYZ", 3.0, 100.0, 106.0)};
    Core::ProfitLedger ledger;

    run_liquidation(ledger);

    auto audit_rows = harness.audit_rows();
    ASSERT_EQ(audit_rows.size(), 1u);
    EXPECT_EQ(audit_rows[0][4], "106");
    EXPECT_EQ(audit_rows[0][5], "order-1");
    EXPECT_EQ(audit_rows[0][6], "success");
    EXPECT_EQ(audit_rows[0][7], "");
}

TEST_F(PositionLiquidationTest, ProceedsAreRoundedToCents) {
    harness.brokerage.positions = {Core::Position("FRAC", 0.333, 10.0, 33.33)};
    Core::ProfitLedger ledger;

    auto result = run_liquidation(ledger);

    EXPECT_DOUBLE_EQ(result.realized_proceeds, 11.10);
    EXPECT_DOUBLE_EQ(ledger.get_funds(), 11.10);
}

TEST_F(PositionLiquidationTest, UnreadablePositionsScanNothing) {
    harness.brokerage.fail_positions = true;
    Core::ProfitLedger ledger(2.0);

    auto result = run_liquidation(ledger);

    EXPECT_EQ(result.positions_scanned, 0);
    EXPECT_TRUE(harness.brokerage.submitted_orders.empty());
    EXPECT_DOUBLE_EQ(ledger.get_funds(), 2.0);
}

TEST_F(PositionLiquidationTest, ConsecutiveSellsArePaced) {
    harness.brokerage.positions = {
        Core::Position("AAA", 1.0, 10.0, 20.0),
        Core::Position("BBB", 1.0, 10.0, 20.0),
        Core::Position("CCC", 1.0, 10.0, 20.0)
    };
    Core::ProfitLedger ledger;

    run_liquidation(ledger);

    EXPECT_EQ(harness.brokerage.submitted_orders.size(), 3u);
    EXPECT_EQ(harness.pacing.waits, 2);
}

TEST_F(PositionLiquidationTest, HalfCentProceedsRoundToEvenCent) {
    harness.brokerage.positions = {Core::Position("XYZ", 1.0, 9.0, 10.125)};
    Core::ProfitLedger ledger(0.0);

    auto result = run_liquidation(ledger);

    EXPECT_DOUBLE_EQ(result.realized_proceeds, 10.12);
    EXPECT_DOUBLE_EQ(ledger.get_funds(), 10.12);
}
