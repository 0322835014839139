#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include <memory>
#include "api/general/brokerage_interface.hpp"
#include "api/sheets/tabular_store_interface.hpp"
#include "trader/account_management/account_manager.hpp"
#include "trader/audit/order_audit_log.hpp"
#include "trader/coordinators/trading_coordinator.hpp"
#include "trader/execution/order_pacing_policy.hpp"
#include "trader/execution/order_submitter.hpp"
#include "trader/ledger/profit_ledger_store.hpp"
#include "trader/signals/signal_sheet_parser.hpp"

/**
 * @brief Runtime module container
 *
 * Holds the run's collaborators as smart pointers for centralized ownership.
 * Members are declared in dependency order so destruction runs dependents first.
 */
struct SystemModules {
    // =========================================================================
    // EXTERNAL COLLABORATORS
    // =========================================================================
    ReinvestTrader::API::BrokeragePtr brokerage;                 // Alpaca trading account
    ReinvestTrader::API::TabularStorePtr screener_store;         // Signal feed tab
    ReinvestTrader::API::TabularStorePtr log_store;              // Audit log and ledger tab

    // =========================================================================
    // ORDER PATH
    // =========================================================================
    ReinvestTrader::Core::OrderPacingPtr pacing_policy;
    std::unique_ptr<ReinvestTrader::Core::OrderAuditLog> audit_log;
    std::unique_ptr<ReinvestTrader::Core::OrderSubmitter> order_submitter;

    // =========================================================================
    // DECISION ENGINE
    // =========================================================================
    std::unique_ptr<ReinvestTrader::Core::AccountManager> account_manager;
    std::unique_ptr<ReinvestTrader::Core::ProfitLedgerStore> ledger_store;
    std::unique_ptr<ReinvestTrader::Core::ScreenerSignalSource> signal_source;
    std::unique_ptr<ReinvestTrader::Core::TradingCoordinator> trading_coordinator;
};

#endif // SYSTEM_MODULES_HPP
