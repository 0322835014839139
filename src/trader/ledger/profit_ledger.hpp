#ifndef PROFIT_LEDGER_HPP
#define PROFIT_LEDGER_HPP

#include "utils/money_utils.hpp"
#include <stdexcept>
#include <string>

namespace ReinvestTrader {
namespace Core {

/**
 * Realized profit waiting to be reinvested. Owned by the run: loaded once,
 * threaded through liquidation and reinvestment, persisted once.
 */
class ProfitLedger {
private:
    double opening_funds;
    double accumulated_funds;

public:
    explicit ProfitLedger(double initial_funds = 0.0)
        : opening_funds(MoneyUtils::round_to_cents(initial_funds)), accumulated_funds(MoneyUtils::round_to_cents(initial_funds)) {
        if (initial_funds < 0.0) {
            throw std::runtime_error("Profit ledger cannot start negative: " + MoneyUtils::format_cents(initial_funds));
        }
    }

    double get_funds() const { return accumulated_funds; }
    double get_opening_funds() const { return opening_funds; }

    // Sell proceeds only. The balance is kept in whole cents so threshold checks see 0.70 + 0.30 as 1.00.
    void add_proceeds(double proceeds_amount) {
        if (proceeds_amount < 0.0) {
            throw std::runtime_error("Sell proceeds cannot be negative: " + MoneyUtils::format_cents(proceeds_amount));
        }
        accumulated_funds = MoneyUtils::round_to_cents(accumulated_funds + MoneyUtils::round_to_cents(proceeds_amount));
    }

    void reset_after_reinvestment() { accumulated_funds = 0.0; }

    bool is_reinvest_pending(double minimum_reinvest_threshold) const {
        return accumulated_funds >= minimum_reinvest_threshold;
    }

    // Value written back to the store
    double get_persisted_value() const { return MoneyUtils::round_to_cents(accumulated_funds); }
};

} // namespace Core
} // namespace ReinvestTrader

#endif // PROFIT_LEDGER_HPP
