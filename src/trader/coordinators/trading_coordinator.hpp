#ifndef TRADING_COORDINATOR_HPP
#define TRADING_COORDINATOR_HPP

#include "configs/system_config.hpp"
#include "trader/account_management/account_manager.hpp"
#include "trader/execution/order_submitter.hpp"
#include "trader/ledger/profit_ledger_store.hpp"
#include "trader/signals/signal_sheet_parser.hpp"
#include "trader/trading_logic/trading_logic_structures.hpp"
#include "trader/trading_logic/position_liquidation.hpp"
#include "trader/trading_logic/profit_reinvestment.hpp"
#include "trader/trading_logic/signal_acquisition.hpp"

namespace ReinvestTrader {
namespace Core {

struct TradingCoordinatorConstructionParams {
    const Config::SystemConfig& system_config;
    AccountManager& account_manager_ref;
    OrderSubmitter& order_submitter_ref;
    ProfitLedgerStore& ledger_store_ref;
    ScreenerSignalSource& signal_source_ref;

    TradingCoordinatorConstructionParams(const Config::SystemConfig& config, AccountManager& account_manager,
                                         OrderSubmitter& order_submitter, ProfitLedgerStore& ledger_store,
                                         ScreenerSignalSource& signal_source)
        : system_config(config), account_manager_ref(account_manager), order_submitter_ref(order_submitter),
          ledger_store_ref(ledger_store), signal_source_ref(signal_source) {}
};

/**
 * One decision run: account snapshot, liquidation, reinvestment, signal
 * read, acquisition, then a single ledger write. AccountUnavailableError
 * propagates before any order is sent and before the ledger is touched.
 */
class TradingCoordinator {
private:
    const Config::SystemConfig& config;
    AccountManager& account_manager;
    OrderSubmitter& order_submitter;
    ProfitLedgerStore& ledger_store;
    ScreenerSignalSource& signal_source;

    PositionLiquidation position_liquidation;
    ProfitReinvestment profit_reinvestment;
    SignalAcquisition signal_acquisition;

    void persist_ledger(const ProfitLedger& ledger, RunSummary& summary);

public:
    explicit TradingCoordinator(const TradingCoordinatorConstructionParams& construction_params);

    RunSummary execute_trading_run();
};

} // namespace Core
} // namespace ReinvestTrader

#endif // TRADING_COORDINATOR_HPP
