#include "trading_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/money_utils.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>
#include <string>

namespace ReinvestTrader {
namespace Logging {

std::string TradingLogs::format_currency(double amount) {
    std::ostringstream oss;
    oss << "$" << std::fixed << std::setprecision(2) << MoneyUtils::round_to_cents(amount);
    return oss.str();
}

std::string TradingLogs::format_percentage(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return oss.str();
}

void TradingLogs::log_run_header(const Config::SystemConfig& config) {
    LOG_RUN_HEADER(std::string("REINVEST TRADER RUN") + (config.flags.dry_run ? " (DRY RUN)" : ""));
    TABLE_HEADER_30("Parameter", "Value");
    TABLE_ROW_30("Started", TimeUtils::get_current_human_readable_time());
    TABLE_ROW_30("Reinvest symbol", config.rules.dividend_symbol);
    TABLE_ROW_30("Profit target", format_percentage(config.rules.profit_target));
    TABLE_ROW_30("Sizing fraction", format_percentage(config.rules.sizing_fraction));
    TABLE_ROW_30("Reinvest min", format_currency(config.rules.minimum_reinvest_threshold));
    TABLE_ROW_30("Order spacing", std::to_string(config.timing.order_spacing_milliseconds) + " ms");
    TABLE_ROW_30("Sheets backend", Config::SheetsConfig::backend_to_string(config.sheets.backend));
    TABLE_FOOTER_30();
}

void TradingLogs::log_account_snapshot(const Core::AccountSnapshot& snapshot) {
    LOG_SECTION_HEADER("ACCOUNT SNAPSHOT");
    LOG_CONTENT("Buying power: " + format_currency(snapshot.buying_power));
    if (snapshot.positions_available) {
        LOG_CONTENT("Open positions: " + std::to_string(snapshot.positions.size()));
    } else {
        LOG_CONTENT("Open positions: unavailable");
    }
    LOG_SECTION_FOOTER();
}

void TradingLogs::log_signals_found(size_t signal_count) {
    log_message("Found " + std::to_string(signal_count) + " eligible Top Picks with Bullish Signal", "");
}

void TradingLogs::log_run_summary(const Core::RunSummary& summary) {
    LOG_SECTION_HEADER("RUN SUMMARY");
    TABLE_HEADER_30("Metric", "Value");
    TABLE_ROW_30("Buying power", format_currency(summary.buying_power));
    TABLE_ROW_30("Eligible signals", std::to_string(summary.eligible_signals));
    TABLE_ROW_30("Orders attempted", std::to_string(summary.orders_attempted()));
    TABLE_ROW_30("Orders succeeded", std::to_string(summary.orders_succeeded()));
    TABLE_ROW_30("Orders failed", std::to_string(summary.orders_failed()));
    TABLE_ROW_30("Sell proceeds", format_currency(summary.liquidation.realized_proceeds));
    TABLE_ROW_30("Reinvested", format_currency(summary.reinvestment.reinvested_amount));
    TABLE_ROW_30("Ledger before", format_currency(summary.ledger_before));
    TABLE_ROW_30("Ledger after", format_currency(summary.ledger_after));
    TABLE_ROW_30("Ledger saved", summary.dry_run ? "NO (dry run)" : (summary.ledger_persisted ? "YES" : "NO"));
    if (summary.audit_failures > 0) {
        TABLE_ROW_30("Audit failures", std::to_string(summary.audit_failures));
    }
    TABLE_FOOTER_30();
    LOG_SECTION_FOOTER();
    log_message("Done submitting orders", "");
}

void TradingLogs::log_ledger_loaded(double funds, bool row_found) {
    if (row_found) {
        log_message("Profit ledger loaded: " + format_currency(funds), "");
    } else {
        log_message("Profit ledger row not found - starting from " + format_currency(funds), "");
    }
}

void TradingLogs::log_ledger_read_failed(const std::string& error_message) {
    log_message("WARNING: Profit ledger unreadable, using $0.00: " + error_message, "");
}

void TradingLogs::log_ledger_persisted(double funds) {
    log_message("Profit ledger saved: " + format_currency(funds), "");
}

void TradingLogs::log_ledger_persist_skipped(double funds) {
    log_message("DRY RUN: profit ledger not saved (would be " + format_currency(funds) + ")", "");
}

void TradingLogs::log_ledger_persist_failed(double funds, const std::string& error_message) {
    log_message("ERROR: Failed to save profit ledger " + format_currency(funds) + ": " + error_message, "");
}

void TradingLogs::log_liquidation_header(double profit_target) {
    LOG_LIQUIDATION_HEADER();
    LOG_CONTENT("Checking open positions for gains of at least " + format_percentage(profit_target));
}

void TradingLogs::log_positions_unavailable(const std::string& error_message) {
    LOG_CONTENT("WARNING: Positions unavailable, nothing to liquidate: " + error_message);
}

void TradingLogs::log_liquidation_candidate(const std::string& symbol, double quantity, double current_price, double gain) {
    std::ostringstream oss;
    oss << "Selling " << MoneyUtils::format_quantity(quantity) << " shares of " << symbol
        << " at " << format_currency(current_price) << " (+" << format_percentage(gain) << ")";
    LOG_CONTENT(oss.str());
}

void TradingLogs::log_liquidation_complete(int positions_scanned, int orders_attempted, double realized_proceeds) {
    LOG_CONTENT("Scanned " + std::to_string(positions_scanned) + " positions, " + std::to_string(orders_attempted) +
                " sell orders, proceeds " + format_currency(realized_proceeds));
    LOG_SECTION_FOOTER();
}

void TradingLogs::log_reinvestment_header(double funds, double threshold) {
    LOG_REINVESTMENT_HEADER();
    LOG_CONTENT("Ledger " + format_currency(funds) + " (threshold " + format_currency(threshold) + ")");
}

void TradingLogs::log_reinvestment_skipped(const std::string& symbol, const std::string& reason) {
    LOG_CONTENT("Skipped " + symbol + " buy: " + reason);
}

void TradingLogs::log_reinvestment_submitting(const std::string& symbol, double amount) {
    LOG_CONTENT("Reinvesting " + format_currency(amount) + " into " + symbol);
}

void TradingLogs::log_acquisition_header(size_t signal_count, double order_notional) {
    LOG_ACQUISITION_HEADER();
    LOG_CONTENT(std::to_string(signal_count) + " signals, order notional " + format_currency(order_notional));
}

void TradingLogs::log_acquisition_skipped(const std::string& symbol, const std::string& reason) {
    LOG_CONTENT("Skipping " + symbol + ": " + reason);
}

void TradingLogs::log_acquisition_submitting(const std::string& symbol, double notional) {
    LOG_CONTENT("Submitting order for " + symbol + " at " + format_currency(notional) + " notional (market order)");
}

void TradingLogs::log_position_lookup_failed(const std::string& symbol, const std::string& error_message) {
    LOG_SUBCONTENT("Position lookup for " + symbol + " failed, treating as not held: " + error_message);
}

void TradingLogs::log_signal_source_unavailable(const std::string& error_message) {
    log_message("WARNING: Signal source unavailable, no signals this run: " + error_message, "");
}

void TradingLogs::log_order_outcome(const Core::OrderAttempt& attempt, bool dry_run) {
    std::string side_label = attempt.side == Core::OrderSide::BUY ? "Buy" : "Sell";
    if (dry_run) {
        LOG_ORDER_RESULT("DRY RUN " + side_label + " " + attempt.symbol + " not sent");
        return;
    }
    if (attempt.succeeded) {
        LOG_ORDER_RESULT(side_label + " order submitted for " + attempt.symbol + ": " + attempt.order_id);
    } else {
        LOG_ORDER_RESULT(side_label + " order failed for " + attempt.symbol + ": " + attempt.error_message);
    }
}

void TradingLogs::log_audit_append_failed(const std::string& symbol, const std::string& error_message) {
    log_message("ERROR: Failed to append audit row for " + symbol + ": " + error_message, "");
}

} // namespace Logging
} // namespace ReinvestTrader
