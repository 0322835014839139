#ifndef TRADING_LOGS_HPP
#define TRADING_LOGS_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/trading_logic/trading_logic_structures.hpp"
#include <string>

namespace ReinvestTrader {
namespace Logging {

/**
 * Decision and order logging for a trading run.
 */
class TradingLogs {
public:
    static std::string format_currency(double amount);
    static std::string format_percentage(double fraction);

    // Run lifecycle
    static void log_run_header(const Config::SystemConfig& config);
    static void log_account_snapshot(const Core::AccountSnapshot& snapshot);
    static void log_signals_found(size_t signal_count);
    static void log_run_summary(const Core::RunSummary& summary);

    // Ledger
    static void log_ledger_loaded(double funds, bool row_found);
    static void log_ledger_read_failed(const std::string& error_message);
    static void log_ledger_persisted(double funds);
    static void log_ledger_persist_skipped(double funds);
    static void log_ledger_persist_failed(double funds, const std::string& error_message);

    // Liquidation
    static void log_liquidation_header(double profit_target);
    static void log_positions_unavailable(const std::string& error_message);
    static void log_liquidation_candidate(const std::string& symbol, double quantity, double current_price, double gain);
    static void log_liquidation_complete(int positions_scanned, int orders_attempted, double realized_proceeds);

    // Reinvestment
    static void log_reinvestment_header(double funds, double threshold);
    static void log_reinvestment_skipped(const std::string& symbol, const std::string& reason);
    static void log_reinvestment_submitting(const std::string& symbol, double amount);

    // Acquisition
    static void log_acquisition_header(size_t signal_count, double order_notional);
    static void log_acquisition_skipped(const std::string& symbol, const std::string& reason);
    static void log_acquisition_submitting(const std::string& symbol, double notional);
    static void log_position_lookup_failed(const std::string& symbol, const std::string& error_message);
    static void log_signal_source_unavailable(const std::string& error_message);

    // Orders
    static void log_order_outcome(const Core::OrderAttempt& attempt, bool dry_run);
    static void log_audit_append_failed(const std::string& symbol, const std::string& error_message);
};

} // namespace Logging
} // namespace ReinvestTrader

#endif // TRADING_LOGS_HPP
