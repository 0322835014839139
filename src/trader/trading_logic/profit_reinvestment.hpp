#ifndef PROFIT_REINVESTMENT_HPP
#define PROFIT_REINVESTMENT_HPP

#include "trader/trading_logic/trading_logic_structures.hpp"
#include "trader/ledger/profit_ledger.hpp"

namespace ReinvestTrader {
namespace Core {

/**
 * Moves the ledger balance into the reinvestment instrument once it reaches
 * the threshold and no buy for the instrument is already open.
 * A successful buy zeroes the ledger; a failed one leaves it for the next run.
 */
class ProfitReinvestment {
private:
    const Config::PortfolioRulesConfig& rules;
    AccountManager& account_manager;
    OrderSubmitter& order_submitter;

public:
    explicit ProfitReinvestment(const TradingStepConstructionParams& construction_params);

    ReinvestmentResult execute(ProfitLedger& ledger);
};

} // namespace Core
} // namespace ReinvestTrader

#endif // PROFIT_REINVESTMENT_HPP
