#ifndef PORTFOLIO_RULES_CONFIG_HPP
#define PORTFOLIO_RULES_CONFIG_HPP

#include <string>

namespace ReinvestTrader {
namespace Config {

struct PortfolioRulesConfig {
    // ========================================================================
    // REINVESTMENT INSTRUMENT
    // ========================================================================

    std::string dividend_symbol = "VIG";             // Instrument that receives realized profit; never liquidated
    double minimum_reinvest_threshold = 1.00;        // Ledger balance that triggers a reinvestment buy
    std::string ledger_sentinel_key = "VIG_FUNDS";   // Column 1 marker of the ledger row in the log tab

    // ========================================================================
    // LIQUIDATION
    // ========================================================================

    double profit_target = 0.05;                     // Fractional gain over average entry that triggers a full sell

    // ========================================================================
    // ACQUISITION
    // ========================================================================

    double sizing_fraction = 0.05;                   // Fraction of buying power committed per signal
    double minimum_order_notional = 1.00;            // Smallest notional the broker accepts for a buy
};

} // namespace Config
} // namespace ReinvestTrader

#endif // PORTFOLIO_RULES_CONFIG_HPP
