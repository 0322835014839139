#include "position_liquidation.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/money_utils.hpp"

using ReinvestTrader::Logging::TradingLogs;

namespace ReinvestTrader {
namespace Core {

PositionLiquidation::PositionLiquidation(const TradingStepConstructionParams& construction_params)
    : rules(construction_params.rules_config), order_submitter(construction_params.order_submitter_ref) {}

LiquidationResult PositionLiquidation::execute(const AccountSnapshot& snapshot, ProfitLedger& ledger) {
    LiquidationResult result;
    TradingLogs::log_liquidation_header(rules.profit_target);

    if (!snapshot.positions_available) {
        TradingLogs::log_positions_unavailable(snapshot.positions_error);
        return result;
    }

    for (const Position& position : snapshot.positions) {
        ++result.positions_scanned;
        if (!is_liquidation_candidate(position)) {
            continue;
        }

        double gain = *compute_gain(position);
        TradingLogs::log_liquidation_candidate(position.symbol, position.quantity, position.current_price, gain);

        OrderAttempt attempt = order_submitter.submit(
            MarketOrderRequest::sell_quantity(position.symbol, position.quantity), position.current_price);
        result.attempts.push_back(attempt);

        if (attempt.succeeded) {
            double proceeds = MoneyUtils::round_to_cents(position.quantity * position.current_price);
            ledger.add_proceeds(proceeds);
            result.realized_proceeds = MoneyUtils::round_to_cents(result.realized_proceeds + proceeds);
            ++result.orders_succeeded;
        } else {
            ++result.orders_failed;
        }
    }

    TradingLogs::log_liquidation_complete(result.positions_scanned, static_cast<int>(result.attempts.size()), result.realized_proceeds);
    return result;
}

std::optional<double> PositionLiquidation::compute_gain(const Position& position) {
    if (position.average_entry_price <= 0.0) {
        return std::nullopt;
    }
    return (position.current_price - position.average_entry_price) / position.average_entry_price;
}

bool PositionLiquidation::is_liquidation_candidate(const Position& position) const {
    if (position.symbol == rules.dividend_symbol || position.quantity <= 0.0) {
        return false;
    }
    auto gain = compute_gain(position);
    return gain && *gain >= rules.profit_target;
}

} // namespace Core
} // namespace ReinvestTrader
