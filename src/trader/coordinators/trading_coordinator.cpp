#include "trading_coordinator.hpp"
#include "logging/logs/trading_logs.hpp"

using ReinvestTrader::Logging::TradingLogs;

namespace ReinvestTrader {
namespace Core {

TradingCoordinator::TradingCoordinator(const TradingCoordinatorConstructionParams& construction_params)
    : config(construction_params.system_config),
      account_manager(construction_params.account_manager_ref),
      order_submitter(construction_params.order_submitter_ref),
      ledger_store(construction_params.ledger_store_ref),
      signal_source(construction_params.signal_source_ref),
      position_liquidation(TradingStepConstructionParams(construction_params.system_config.rules,
                                                         construction_params.account_manager_ref,
                                                         construction_params.order_submitter_ref)),
      profit_reinvestment(TradingStepConstructionParams(construction_params.system_config.rules,
                                                        construction_params.account_manager_ref,
                                                        construction_params.order_submitter_ref)),
      signal_acquisition(TradingStepConstructionParams(construction_params.system_config.rules,
                                                       construction_params.account_manager_ref,
                                                       construction_params.order_submitter_ref)) {}

RunSummary TradingCoordinator::execute_trading_run() {
    RunSummary summary;
    summary.dry_run = config.flags.dry_run;
    TradingLogs::log_run_header(config);

    AccountSnapshot snapshot = account_manager.fetch_account_snapshot();
    summary.buying_power = snapshot.buying_power;
    TradingLogs::log_account_snapshot(snapshot);

    ProfitLedger ledger = ledger_store.load();
    summary.ledger_before = ledger.get_opening_funds();

    summary.liquidation = position_liquidation.execute(snapshot, ledger);
    summary.reinvestment = profit_reinvestment.execute(ledger);

    std::vector<Signal> signals = signal_source.read_signals();
    summary.eligible_signals = static_cast<int>(signals.size());
    TradingLogs::log_signals_found(signals.size());

    summary.acquisition = signal_acquisition.execute(signals, snapshot.buying_power);

    summary.ledger_after = ledger.get_persisted_value();
    persist_ledger(ledger, summary);
    summary.audit_failures = order_submitter.get_audit_failure_count();

    TradingLogs::log_run_summary(summary);
    return summary;
}

void TradingCoordinator::persist_ledger(const ProfitLedger& ledger, RunSummary& summary) {
    if (config.flags.dry_run) {
        TradingLogs::log_ledger_persist_skipped(ledger.get_persisted_value());
        return;
    }

    try {
        ledger_store.save(ledger);
        summary.ledger_persisted = true;
        TradingLogs::log_ledger_persisted(ledger.get_persisted_value());
    } catch (const std::exception& exception_error) {
        summary.ledger_persist_error = exception_error.what();
        TradingLogs::log_ledger_persist_failed(ledger.get_persisted_value(), summary.ledger_persist_error);
    }
}

} // namespace Core
} // namespace ReinvestTrader
