#ifndef ORDER_SUBMITTER_HPP
#define ORDER_SUBMITTER_HPP

#include "api/general/brokerage_interface.hpp"
#include "trader/audit/order_audit_log.hpp"
#include "trader/execution/order_pacing_policy.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <optional>

namespace ReinvestTrader {
namespace Core {

struct OrderSubmitterConstructionParams {
    API::BrokerageInterface& brokerage_ref;
    OrderAuditLog& audit_log_ref;
    OrderPacingPolicy& pacing_policy_ref;
    bool dry_run;

    OrderSubmitterConstructionParams(API::BrokerageInterface& brokerage, OrderAuditLog& audit_log,
                                     OrderPacingPolicy& pacing_policy, bool dry_run_mode)
        : brokerage_ref(brokerage), audit_log_ref(audit_log), pacing_policy_ref(pacing_policy), dry_run(dry_run_mode) {}
};

/**
 * Single path for every order the engine sends. Paces consecutive
 * submissions, converts broker errors into a failed attempt and appends the
 * attempt to the audit log. In dry-run mode nothing is sent or appended.
 */
class OrderSubmitter {
private:
    API::BrokerageInterface& brokerage;
    OrderAuditLog& audit_log;
    OrderPacingPolicy& pacing_policy;
    bool dry_run;
    int submissions_made;
    int audit_failures;

public:
    explicit OrderSubmitter(const OrderSubmitterConstructionParams& construction_params);

    // audit_reference_price fills the price column of the audit row
    OrderAttempt submit(const MarketOrderRequest& request, std::optional<double> audit_reference_price);

    int get_submission_count() const { return submissions_made; }
    int get_audit_failure_count() const { return audit_failures; }
    bool is_dry_run() const { return dry_run; }
};

} // namespace Core
} // namespace ReinvestTrader

#endif // ORDER_SUBMITTER_HPP
