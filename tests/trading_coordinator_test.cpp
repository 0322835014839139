// =============================================================================
// trading_coordinator_test.cpp
// =============================================================================
// Whole runs over in-memory collaborators: step ordering, ledger conservation
// and single write, fatal account errors, dry run and idempotence.
// =============================================================================

#include "trader/coordinators/trading_coordinator.hpp"
#include "mocks/trading_test_harness.hpp"

#include <gtest/gtest.h>

using namespace ReinvestTrader;
using ReinvestTrader::Testing::TradingHarness;
using ReinvestTrader::Testing::screener_header;
using ReinvestTrader::Testing::screener_row;

static const std::string CHECK_MARK = "\xE2\x9C\x85";

class TradingCoordinatorTest : public ::testing::Test {
protected:
    TradingHarness harness;

    void SetUp() override {
        harness.brokerage.buying_power = 1000.0;
        harness.screener_store.rows = {screener_header()};
    }
};

TEST_F(TradingCoordinatorTest, RunsStepsInOrderAndPersistsLedgerOnce) {
    harness.brokerage.positions = {Core::Position("XYZ", 0.1, 5.0, 6.0)};
    harness.screener_store.rows.push_back(screener_row("ABC", "12.50", "top pick", CHECK_MARK));
    harness.set_ledger_row("0.50");
    harness.build();

    auto summary = harness.coordinator->execute_trading_run();

    ASSERT_EQ(harness.brokerage.submitted_orders.size(), 3u);
    EXPECT_EQ(harness.brokerage.submitted_orders[0].symbol, "XYZ");
    EXPECT_EQ(harness.brokerage.submitted_orders[0].side, Core::OrderSide::SELL);
    EXPECT_EQ(harness.brokerage.submitted_orders[1].symbol, "VIG");
    EXPECT_DOUBLE_EQ(*harness.brokerage.submitted_orders[1].notional, 1.10);
    EXPECT_EQ(harness.brokerage.submitted_orders[2].symbol, "ABC");
    EXPECT_DOUBLE_EQ(*harness.brokerage.submitted_orders[2].notional, 50.0);

    EXPECT_TRUE(summary.ledger_persisted);
    EXPECT_DOUBLE_EQ(summary.ledger_before, 0.50);
    EXPECT_DOUBLE_EQ(summary.ledger_after, 0.0);
    EXPECT_EQ(harness.log_store.update_count, 1);
    EXPECT_EQ(harness.log_store.rows[0][1], "0.00");
    EXPECT_EQ(summary.orders_attempted(), 3);
    EXPECT_EQ(summary.orders_succeeded(), 3);
}

TEST_F(TradingCoordinatorTest, LedgerIsConservedAcrossFailures) {
    harness.brokerage.positions = {
        Core::Position("AAA", 2.0, 10.0, 11.0),
        Core::Position("BBB", 1.0, 10.0, 12.0),
        Core::Position("CCC", 1.0, 10.0, 13.0)
    };
    harness.brokerage.rejected_symbols["BBB"] = "rejected";
    harness.brokerage.rejected_symbols["VIG"] = "rejected";
    harness.set_ledger_row("3.00");
    harness.build();

    auto summary = harness.coordinator->execute_trading_run();

    double expected_after = 3.00 + 22.00 + 13.00;
    EXPECT_DOUBLE_EQ(summary.liquidation.realized_proceeds, 35.00);
    EXPECT_DOUBLE_EQ(summary.ledger_after, expected_after);
    EXPECT_EQ(harness.log_store.rows[0][1], "38.00");
    EXPECT_FALSE(summary.reinvestment.order_succeeded);
}

TEST_F(TradingCoordinatorTest, FirstRunAppendsLedgerRow) {
    harness.brokerage.positions = {Core::Position("XYZ", 0.05, 10.0, 11.0)};
    harness.build();

    auto summary = harness.coordinator->execute_trading_run();

    EXPECT_DOUBLE_EQ(summary.ledger_after, 0.55);
    ASSERT_FALSE(harness.log_store.rows.empty());
    EXPECT_EQ(harness.log_store.rows.back(), (std::vector<std::string>{"VIG_FUNDS", "0.55"}));
    EXPECT_EQ(harness.brokerage.count_submitted("VIG", Core::OrderSide::BUY), 0);
}

TEST_F(TradingCoordinatorTest, UnavailableAccountStopsBeforeAnyOrderOrLedgerWrite) {
    harness.brokerage.fail_buying_power = true;
    harness.brokerage.positions = {Core::Position("XYZ", 1.0, 10.0, 20.0)};
    harness.set_ledger_row("5.00");
    harness.build();

    EXPECT_THROW(harness.coordinator->execute_trading_run(), Core::AccountUnavailableError);
    EXPECT_TRUE(harness.brokerage.submitted_orders.empty());
    EXPECT_EQ(harness.log_store.update_count, 0);
    EXPECT_EQ(harness.log_store.append_count, 0);
}

TEST_F(TradingCoordinatorTest, BuyingPowerIsMeasuredBeforeSells) {
    harness.brokerage.positions = {Core::Position("XYZ", 10.0, 10.0, 100.0)};
    harness.screener_store.rows.push_back(screener_row("ABC", "1", "TOP", CHECK_MARK));
    harness.build();

    harness.coordinator->execute_trading_run();

    ASSERT_EQ(harness.brokerage.count_submitted("ABC", Core::OrderSide::BUY), 1);
    EXPECT_DOUBLE_EQ(*harness.brokerage.submitted_orders.back().notional, 50.0);
}

TEST_F(TradingCoordinatorTest, SecondRunAgainstSameStateOpensNothingNew) {
    harness.brokerage.record_buys_as_open_orders = true;
    harness.screener_store.rows.push_back(screener_row("ABC", "1", "TOP", CHECK_MARK));
    harness.screener_store.rows.push_back(screener_row("DEF", "2", "TOP", CHECK_MARK));
    harness.build();

    auto first_summary = harness.coordinator->execute_trading_run();
    EXPECT_EQ(first_summary.orders_succeeded(), 2);

    auto second_summary = harness.coordinator->execute_trading_run();
    EXPECT_EQ(second_summary.orders_attempted(), 0);
    EXPECT_EQ(harness.brokerage.submitted_orders.size(), 2u);
}

TEST_F(TradingCoordinatorTest, DryRunSendsNothingAndLeavesStoreUntouched) {
    harness.config.flags.dry_run = true;
    harness.brokerage.positions = {Core::Position("XYZ", 1.0, 10.0, 20.0)};
    harness.screener_store.rows.push_back(screener_row("ABC", "1", "TOP", CHECK_MARK));
    harness.set_ledger_row("0.50");
    harness.build();

    auto summary = harness.coordinator->execute_trading_run();

    EXPECT_TRUE(harness.brokerage.submitted_orders.empty());
    EXPECT_EQ(harness.log_store.append_count, 0);
    EXPECT_EQ(harness.log_store.update_count, 0);
    EXPECT_EQ(harness.log_store.rows[0][1], "0.50");
    EXPECT_FALSE(summary.ledger_persisted);
    EXPECT_EQ(summary.orders_attempted(), 3);
}

TEST_F(TradingCoordinatorTest, LedgerWriteFailureIsReported) {
    harness.brokerage.positions = {Core::Position("XYZ", 0.05, 10.0, 11.0)};
    harness.log_store.fail_appends = true;
    harness.build();

    auto summary = harness.coordinator->execute_trading_run();

    EXPECT_FALSE(summary.ledger_persisted);
    EXPECT_FALSE(summary.ledger_persist_error.empty());
    EXPECT_EQ(summary.audit_failures, 1);
}

TEST_F(TradingCoordinatorTest, MissingScreenerColumnsStillLiquidates) {
    harness.screener_store.rows = {{"Symbol", "Score"}, {"ABC", "9"}};
    harness.brokerage.positions = {Core::Position("XYZ", 1.0, 10.0, 20.0)};
    harness.build();

    auto summary = harness.coordinator->execute_trading_run();

    EXPECT_EQ(summary.eligible_signals, 0);
    EXPECT_EQ(harness.brokerage.count_submitted("XYZ", Core::OrderSide::SELL), 1);
}
