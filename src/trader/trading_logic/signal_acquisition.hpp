#ifndef SIGNAL_ACQUISITION_HPP
#define SIGNAL_ACQUISITION_HPP

#include "trader/trading_logic/trading_logic_structures.hpp"
#include <set>
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace Core {

/**
 * Opens a fixed-fraction notional buy for each eligible signal that is not
 * already held and has no open buy order. Signals are taken in source order.
 */
class SignalAcquisition {
private:
    const Config::PortfolioRulesConfig& rules;
    AccountManager& account_manager;
    OrderSubmitter& order_submitter;

public:
    explicit SignalAcquisition(const TradingStepConstructionParams& construction_params);

    // buying_power is the value measured before any of this run's orders
    AcquisitionResult execute(const std::vector<Signal>& signals, double buying_power);

    double compute_order_notional(double buying_power) const;
};

} // namespace Core
} // namespace ReinvestTrader

#endif // SIGNAL_ACQUISITION_HPP
