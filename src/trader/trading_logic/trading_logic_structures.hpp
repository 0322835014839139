#ifndef TRADING_LOGIC_STRUCTURES_HPP
#define TRADING_LOGIC_STRUCTURES_HPP

#include "configs/system_config.hpp"
#include "trader/account_management/account_manager.hpp"
#include "trader/execution/order_submitter.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace Core {

struct TradingStepConstructionParams {
    const Config::PortfolioRulesConfig& rules_config;
    AccountManager& account_manager_ref;
    OrderSubmitter& order_submitter_ref;

    TradingStepConstructionParams(const Config::PortfolioRulesConfig& rules, AccountManager& account_manager,
                                  OrderSubmitter& order_submitter)
        : rules_config(rules), account_manager_ref(account_manager), order_submitter_ref(order_submitter) {}
};

struct LiquidationResult {
    int positions_scanned;
    int orders_succeeded;
    int orders_failed;
    double realized_proceeds;
    std::vector<OrderAttempt> attempts;

    LiquidationResult() : positions_scanned(0), orders_succeeded(0), orders_failed(0), realized_proceeds(0.0) {}
};

struct ReinvestmentResult {
    bool order_attempted;
    bool order_succeeded;
    double reinvested_amount;          // Non-zero only when the buy succeeded
    std::string skip_reason;           // Empty when an order was attempted
    std::vector<OrderAttempt> attempts;

    ReinvestmentResult() : order_attempted(false), order_succeeded(false), reinvested_amount(0.0) {}
};

struct AcquisitionResult {
    int signals_considered;
    int signals_skipped;
    int orders_succeeded;
    int orders_failed;
    std::vector<OrderAttempt> attempts;

    AcquisitionResult() : signals_considered(0), signals_skipped(0), orders_succeeded(0), orders_failed(0) {}
};

struct RunSummary {
    double buying_power;
    int eligible_signals;
    double ledger_before;
    double ledger_after;
    bool ledger_persisted;
    std::string ledger_persist_error;
    int audit_failures;
    bool dry_run;
    LiquidationResult liquidation;
    ReinvestmentResult reinvestment;
    AcquisitionResult acquisition;

    RunSummary()
        : buying_power(0.0), eligible_signals(0), ledger_before(0.0), ledger_after(0.0),
          ledger_persisted(false), audit_failures(0), dry_run(false) {}

    int orders_attempted() const {
        return static_cast<int>(liquidation.attempts.size() + reinvestment.attempts.size() + acquisition.attempts.size());
    }
    int orders_succeeded() const {
        return liquidation.orders_succeeded + (reinvestment.order_succeeded ? 1 : 0) + acquisition.orders_succeeded;
    }
    int orders_failed() const { return orders_attempted() - orders_succeeded(); }
};

} // namespace Core
} // namespace ReinvestTrader

#endif // TRADING_LOGIC_STRUCTURES_HPP
