#ifndef ORDER_AUDIT_LOG_HPP
#define ORDER_AUDIT_LOG_HPP

#include "api/sheets/tabular_store_interface.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace ReinvestTrader {
namespace Core {

/**
 * Append-only record of order attempts, one row per attempt:
 * timestamp, symbol, side, notional, price, order id, success|fail, error.
 */
class OrderAuditLog {
private:
    API::TabularStoreInterface& log_store;

public:
    explicit OrderAuditLog(API::TabularStoreInterface& log_store_ref);

    // Append failures are logged and reported through the return value; the order has already been sent
    bool record(const OrderAttempt& attempt);

    static API::TableRow format_attempt_row(const OrderAttempt& attempt);
};

} // namespace Core
} // namespace ReinvestTrader

#endif // ORDER_AUDIT_LOG_HPP
