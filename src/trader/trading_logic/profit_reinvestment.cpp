#include "profit_reinvestment.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/money_utils.hpp"

using ReinvestTrader::Logging::TradingLogs;

namespace ReinvestTrader {
namespace Core {

ProfitReinvestment::ProfitReinvestment(const TradingStepConstructionParams& construction_params)
    : rules(construction_params.rules_config),
      account_manager(construction_params.account_manager_ref),
      order_submitter(construction_params.order_submitter_ref) {}

ReinvestmentResult ProfitReinvestment::execute(ProfitLedger& ledger) {
    ReinvestmentResult result;
    TradingLogs::log_reinvestment_header(ledger.get_funds(), rules.minimum_reinvest_threshold);

    if (!ledger.is_reinvest_pending(rules.minimum_reinvest_threshold)) {
        result.skip_reason = "ledger below threshold";
        return result;
    }

    OpenOrderCheckResult open_order_check = account_manager.check_open_buy_order(rules.dividend_symbol);
    if (!open_order_check.check_succeeded) {
        result.skip_reason = "open order check failed: " + open_order_check.error_message;
        TradingLogs::log_reinvestment_skipped(rules.dividend_symbol, result.skip_reason);
        return result;
    }
    if (open_order_check.has_open_buy_order) {
        result.skip_reason = "outstanding buy order exists";
        TradingLogs::log_reinvestment_skipped(rules.dividend_symbol, result.skip_reason);
        return result;
    }

    double reinvest_amount = MoneyUtils::round_to_cents(ledger.get_funds());
    TradingLogs::log_reinvestment_submitting(rules.dividend_symbol, reinvest_amount);

    OrderAttempt attempt = order_submitter.submit(
        MarketOrderRequest::buy_notional(rules.dividend_symbol, reinvest_amount), std::nullopt);
    result.attempts.push_back(attempt);
    result.order_attempted = true;
    result.order_succeeded = attempt.succeeded;

    if (attempt.succeeded) {
        result.reinvested_amount = reinvest_amount;
        ledger.reset_after_reinvestment();
    }
    return result;
}

} // namespace Core
} // namespace ReinvestTrader
