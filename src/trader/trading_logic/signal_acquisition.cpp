#include "signal_acquisition.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/money_utils.hpp"

using ReinvestTrader::Logging::TradingLogs;

namespace ReinvestTrader {
namespace Core {

SignalAcquisition::SignalAcquisition(const TradingStepConstructionParams& construction_params)
    : rules(construction_params.rules_config),
      account_manager(construction_params.account_manager_ref),
      order_submitter(construction_params.order_submitter_ref) {}

double SignalAcquisition::compute_order_notional(double buying_power) const {
    if (buying_power <= 0.0) {
        return 0.0;
    }
    return MoneyUtils::round_to_cents(rules.sizing_fraction * buying_power);
}

AcquisitionResult SignalAcquisition::execute(const std::vector<Signal>& signals, double buying_power) {
    AcquisitionResult result;
    double order_notional = compute_order_notional(buying_power);
    TradingLogs::log_acquisition_header(signals.size(), order_notional);

    // Symbols bought earlier in this run; the broker may not list the order as open yet
    std::set<std::string> symbols_bought_this_run;

    for (const Signal& signal : signals) {
        ++result.signals_considered;

        if (signal.symbol.empty() || signal.symbol == rules.dividend_symbol) {
            ++result.signals_skipped;
            continue;
        }

        if (order_notional < rules.minimum_order_notional) {
            TradingLogs::log_acquisition_skipped(signal.symbol, "notional " + MoneyUtils::format_cents(order_notional) +
                                                 " below minimum " + MoneyUtils::format_cents(rules.minimum_order_notional));
            ++result.signals_skipped;
            continue;
        }

        if (symbols_bought_this_run.count(signal.symbol) > 0) {
            TradingLogs::log_acquisition_skipped(signal.symbol, "already bought this run");
            ++result.signals_skipped;
            continue;
        }

        if (account_manager.has_position(signal.symbol)) {
            TradingLogs::log_acquisition_skipped(signal.symbol, "already held in portfolio");
            ++result.signals_skipped;
            continue;
        }

        OpenOrderCheckResult open_order_check = account_manager.check_open_buy_order(signal.symbol);
        if (!open_order_check.check_succeeded) {
            TradingLogs::log_acquisition_skipped(signal.symbol, "open order check failed: " + open_order_check.error_message);
            ++result.signals_skipped;
            continue;
        }
        if (open_order_check.has_open_buy_order) {
            TradingLogs::log_acquisition_skipped(signal.symbol, "outstanding buy order exists");
            ++result.signals_skipped;
            continue;
        }

        TradingLogs::log_acquisition_submitting(signal.symbol, order_notional);
        OrderAttempt attempt = order_submitter.submit(
            MarketOrderRequest::buy_notional(signal.symbol, order_notional), signal.reference_price);
        result.attempts.push_back(attempt);

        if (attempt.succeeded) {
            symbols_bought_this_run.insert(signal.symbol);
            ++result.orders_succeeded;
        } else {
            ++result.orders_failed;
        }
    }

    return result;
}

} // namespace Core
} // namespace ReinvestTrader
