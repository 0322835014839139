#include "order_submitter.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/time_utils.hpp"

using ReinvestTrader::Logging::TradingLogs;

namespace ReinvestTrader {
namespace Core {

OrderSubmitter::OrderSubmitter(const OrderSubmitterConstructionParams& construction_params)
    : brokerage(construction_params.brokerage_ref),
      audit_log(construction_params.audit_log_ref),
      pacing_policy(construction_params.pacing_policy_ref),
      dry_run(construction_params.dry_run),
      submissions_made(0),
      audit_failures(0) {}

OrderAttempt OrderSubmitter::submit(const MarketOrderRequest& request, std::optional<double> audit_reference_price) {
    OrderSubmissionResult submission_result;

    if (dry_run) {
        submission_result = OrderSubmissionResult::ok("dry-run");
    } else {
        if (submissions_made > 0) {
            pacing_policy.wait_between_orders();
        }

        try {
            submission_result = brokerage.submit_market_order(request);
        } catch (const std::exception& exception_error) {
            submission_result = OrderSubmissionResult::failed(exception_error.what());
        }
    }
    ++submissions_made;

    OrderAttempt attempt;
    attempt.timestamp = TimeUtils::get_current_local_iso_time();
    attempt.symbol = request.symbol;
    attempt.side = request.side;
    attempt.notional = request.notional;
    attempt.quantity = request.quantity;
    attempt.reference_price = audit_reference_price;
    attempt.order_id = submission_result.order_id;
    attempt.succeeded = submission_result.succeeded;
    attempt.error_message = submission_result.error_message;

    TradingLogs::log_order_outcome(attempt, dry_run);

    if (!dry_run && !audit_log.record(attempt)) {
        ++audit_failures;
    }
    return attempt;
}

} // namespace Core
} // namespace ReinvestTrader
