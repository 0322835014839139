#ifndef POSITION_LIQUIDATION_HPP
#define POSITION_LIQUIDATION_HPP

#include "trader/trading_logic/trading_logic_structures.hpp"
#include "trader/ledger/profit_ledger.hpp"

namespace ReinvestTrader {
namespace Core {

/**
 * Sells the full quantity of every position whose gain over average entry
 * has reached the profit target. The reinvestment instrument is never sold.
 * Proceeds of successful sells are added to the ledger.
 */
class PositionLiquidation {
private:
    const Config::PortfolioRulesConfig& rules;
    OrderSubmitter& order_submitter;

public:
    explicit PositionLiquidation(const TradingStepConstructionParams& construction_params);

    LiquidationResult execute(const AccountSnapshot& snapshot, ProfitLedger& ledger);

    // Fractional gain, or std::nullopt when the entry price gives no meaningful ratio
    static std::optional<double> compute_gain(const Position& position);
    bool is_liquidation_candidate(const Position& position) const;
};

} // namespace Core
} // namespace ReinvestTrader

#endif // POSITION_LIQUIDATION_HPP
