#include "order_audit_log.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/money_utils.hpp"

using ReinvestTrader::Logging::TradingLogs;

namespace ReinvestTrader {
namespace Core {

OrderAuditLog::OrderAuditLog(API::TabularStoreInterface& log_store_ref) : log_store(log_store_ref) {}

bool OrderAuditLog::record(const OrderAttempt& attempt) {
    try {
        log_store.append_row(format_attempt_row(attempt));
        return true;
    } catch (const std::exception& exception_error) {
        TradingLogs::log_audit_append_failed(attempt.symbol, exception_error.what());
        return false;
    }
}

API::TableRow OrderAuditLog::format_attempt_row(const OrderAttempt& attempt) {
    return {
        attempt.timestamp,
        attempt.symbol,
        order_side_to_string(attempt.side),
        attempt.notional ? MoneyUtils::format_cents(*attempt.notional) : "",
        attempt.reference_price ? MoneyUtils::format_quantity(*attempt.reference_price) : "",
        attempt.order_id,
        attempt.succeeded ? "success" : "fail",
        attempt.error_message
    };
}

} // namespace Core
} // namespace ReinvestTrader
