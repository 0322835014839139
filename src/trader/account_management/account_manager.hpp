#ifndef ACCOUNT_MANAGER_HPP
#define ACCOUNT_MANAGER_HPP

#include "api/general/brokerage_interface.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <stdexcept>
#include <string>

namespace ReinvestTrader {
namespace Core {

// Buying power could not be read. The run stops before any order and the ledger is left untouched.
class AccountUnavailableError : public std::runtime_error {
public:
    explicit AccountUnavailableError(const std::string& error_message) : std::runtime_error(error_message) {}
};

struct OpenOrderCheckResult {
    bool check_succeeded;
    bool has_open_buy_order;
    std::string error_message;

    OpenOrderCheckResult() : check_succeeded(false), has_open_buy_order(false) {}
};

class AccountManager {
private:
    API::BrokerageInterface& brokerage;

public:
    explicit AccountManager(API::BrokerageInterface& brokerage_ref);

    // Buying power plus positions. Throws AccountUnavailableError when buying power is unreadable;
    // an unreadable positions list is reported through positions_available instead.
    AccountSnapshot fetch_account_snapshot() const;

    // True only for a confirmed position with positive quantity. Lookup failures count as not held.
    bool has_position(const std::string& symbol) const;

    OpenOrderCheckResult check_open_buy_order(const std::string& symbol) const;
};

} // namespace Core
} // namespace ReinvestTrader

#endif // ACCOUNT_MANAGER_HPP
