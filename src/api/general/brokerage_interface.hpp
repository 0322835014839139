#ifndef BROKERAGE_INTERFACE_HPP
#define BROKERAGE_INTERFACE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace API {

/**
 * Account, position and order access for one brokerage account.
 * Read operations throw std::runtime_error on failure; order submission
 * reports failure through its result and does not throw.
 */
class BrokerageInterface {
public:
    virtual ~BrokerageInterface() = default;

    virtual double get_buying_power() const = 0;
    virtual std::vector<Core::Position> get_positions() const = 0;

    // std::nullopt when the account holds nothing in the symbol
    virtual std::optional<Core::Position> get_position(const std::string& symbol) const = 0;

    virtual std::vector<Core::OpenOrder> get_open_orders(const std::string& symbol, Core::OrderSide side) const = 0;

    virtual Core::OrderSubmissionResult submit_market_order(const Core::MarketOrderRequest& request) const = 0;

    virtual std::string get_provider_name() const = 0;
};

using BrokeragePtr = std::unique_ptr<BrokerageInterface>;

} // namespace API
} // namespace ReinvestTrader

#endif // BROKERAGE_INTERFACE_HPP
