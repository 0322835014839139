#ifndef TRADING_TEST_HARNESS_HPP
#define TRADING_TEST_HARNESS_HPP

#include "configs/system_config.hpp"
#include "trader/account_management/account_manager.hpp"
#include "trader/audit/order_audit_log.hpp"
#include "trader/coordinators/trading_coordinator.hpp"
#include "trader/execution/order_pacing_policy.hpp"
#include "trader/execution/order_submitter.hpp"
#include "trader/ledger/profit_ledger_store.hpp"
#include "trader/signals/signal_sheet_parser.hpp"
#include "mocks/fake_brokerage.hpp"
#include "mocks/in_memory_tabular_store.hpp"
#include <memory>
#include <string>

namespace ReinvestTrader {
namespace Testing {

class CountingPacing : public Core::OrderPacingPolicy {
public:
    int waits = 0;
    void wait_between_orders() override { ++waits; }
};

inline API::TableRow screener_header() {
    return {"Ticker", "Price", "TopPick", "Bullish Signal"};
}

inline API::TableRow screener_row(const std::string& ticker, const std::string& price,
                                  const std::string& top_pick, const std::string& bullish) {
    return {ticker, price, top_pick, bullish};
}

/**
 * Wires the decision engine over in-memory collaborators. Tests adjust the
 * config, brokerage and stores, then call build().
 */
struct TradingHarness {
    Config::SystemConfig config;
    FakeBrokerage brokerage;
    InMemoryTabularStore screener_store;
    InMemoryTabularStore log_store;
    CountingPacing pacing;

    std::unique_ptr<Core::OrderAuditLog> audit_log;
    std::unique_ptr<Core::OrderSubmitter> order_submitter;
    std::unique_ptr<Core::AccountManager> account_manager;
    std::unique_ptr<Core::ProfitLedgerStore> ledger_store;
    std::unique_ptr<Core::ScreenerSignalSource> signal_source;
    std::unique_ptr<Core::TradingCoordinator> coordinator;

    void build() {
        audit_log = std::make_unique<Core::OrderAuditLog>(log_store);
        order_submitter = std::make_unique<Core::OrderSubmitter>(
            Core::OrderSubmitterConstructionParams(brokerage, *audit_log, pacing, config.flags.dry_run));
        account_manager = std::make_unique<Core::AccountManager>(brokerage);
        ledger_store = std::make_unique<Core::ProfitLedgerStore>(log_store, config.rules.ledger_sentinel_key);
        signal_source = std::make_unique<Core::ScreenerSignalSource>(screener_store);
        coordinator = std::make_unique<Core::TradingCoordinator>(Core::TradingCoordinatorConstructionParams(
            config, *account_manager, *order_submitter, *ledger_store, *signal_source));
    }

    Core::TradingStepConstructionParams step_params() {
        return Core::TradingStepConstructionParams(config.rules, *account_manager, *order_submitter);
    }

    void set_ledger_row(const std::string& value) {
        log_store.rows.push_back({config.rules.ledger_sentinel_key, value});
    }

    std::vector<API::TableRow> audit_rows() const {
        return log_store.rows_without_key(config.rules.ledger_sentinel_key);
    }
};

} // namespace Testing
} // namespace ReinvestTrader

#endif // TRADING_TEST_HARNESS_HPP
