#include "account_manager.hpp"
#include "logging/logs/trading_logs.hpp"

using ReinvestTrader::Logging::TradingLogs;

namespace ReinvestTrader {
namespace Core {

AccountManager::AccountManager(API::BrokerageInterface& brokerage_ref) : brokerage(brokerage_ref) {}

AccountSnapshot AccountManager::fetch_account_snapshot() const {
    AccountSnapshot snapshot;

    try {
        snapshot.buying_power = brokerage.get_buying_power();
    } catch (const std::exception& exception_error) {
        throw AccountUnavailableError("Unable to read buying power from " + brokerage.get_provider_name() + ": " + exception_error.what());
    }

    try {
        snapshot.positions = brokerage.get_positions();
        snapshot.positions_available = true;
    } catch (const std::exception& exception_error) {
        snapshot.positions.clear();
        snapshot.positions_available = false;
        snapshot.positions_error = exception_error.what();
    }

    return snapshot;
}

bool AccountManager::has_position(const std::string& symbol) const {
    try {
        auto position = brokerage.get_position(symbol);
        return position && position->quantity > 0.0;
    } catch (const std::exception& exception_error) {
        TradingLogs::log_position_lookup_failed(symbol, exception_error.what());
        return false;
    }
}

OpenOrderCheckResult AccountManager::check_open_buy_order(const std::string& symbol) const {
    OpenOrderCheckResult check_result;
    try {
        check_result.has_open_buy_order = !brokerage.get_open_orders(symbol, OrderSide::BUY).empty();
        check_result.check_succeeded = true;
    } catch (const std::exception& exception_error) {
        check_result.error_message = exception_error.what();
    }
    return check_result;
}

} // namespace Core
} // namespace ReinvestTrader
