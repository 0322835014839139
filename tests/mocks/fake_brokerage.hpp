#ifndef FAKE_BROKERAGE_HPP
#define FAKE_BROKERAGE_HPP

#include "api/general/brokerage_interface.hpp"
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace Testing {

// In-memory brokerage. Failure switches make each read throw the way the HTTP adapter does.
class FakeBrokerage : public API::BrokerageInterface {
public:
    double buying_power = 0.0;
    bool fail_buying_power = false;

    std::vector<Core::Position> positions;
    bool fail_positions = false;
    std::set<std::string> failing_position_lookups;

    mutable std::vector<Core::OpenOrder> open_orders;    // submissions can open orders
    std::set<std::string> failing_open_order_lookups;

    std::map<std::string, std::string> rejected_symbols;   // symbol -> broker error text
    bool record_buys_as_open_orders = false;

    mutable std::vector<Core::MarketOrderRequest> submitted_orders;
    mutable int open_order_queries = 0;
    mutable int next_order_number = 1;

    double get_buying_power() const override {
        if (fail_buying_power) {
            throw std::runtime_error("account endpoint unreachable");
        }
        return buying_power;
    }

    std::vector<Core::Position> get_positions() const override {
        if (fail_positions) {
            throw std::runtime_error("positions endpoint unreachable");
        }
        return positions;
    }

    std::optional<Core::Position> get_position(const std::string& symbol) const override {
        if (failing_position_lookups.count(symbol) > 0) {
            throw std::runtime_error("position lookup timed out");
        }
        for (const auto& position : positions) {
            if (position.symbol == symbol) {
                return position;
            }
        }
        return std::nullopt;
    }

    std::vector<Core::OpenOrder> get_open_orders(const std::string& symbol, Core::OrderSide side) const override {
        ++open_order_queries;
        if (failing_open_order_lookups.count(symbol) > 0) {
            throw std::runtime_error("orders endpoint unreachable");
        }
        std::vector<Core::OpenOrder> matching_orders;
        for (const auto& open_order : open_orders) {
            if (open_order.symbol == symbol && open_order.side == side) {
                matching_orders.push_back(open_order);
            }
        }
        return matching_orders;
    }

    Core::OrderSubmissionResult submit_market_order(const Core::MarketOrderRequest& request) const override {
        submitted_orders.push_back(request);
        auto rejection = rejected_symbols.find(request.symbol);
        if (rejection != rejected_symbols.end()) {
            return Core::OrderSubmissionResult::failed(rejection->second);
        }

        std::string order_id = "order-" + std::to_string(next_order_number++);
        if (record_buys_as_open_orders && request.side == Core::OrderSide::BUY) {
            Core::OpenOrder open_order;
            open_order.order_id = order_id;
            open_order.symbol = request.symbol;
            open_order.side = Core::OrderSide::BUY;
            open_order.status = "accepted";
            open_orders.push_back(open_order);
        }
        return Core::OrderSubmissionResult::ok(order_id);
    }

    std::string get_provider_name() const override { return "Fake Brokerage"; }

    void add_open_buy_order(const std::string& symbol) {
        Core::OpenOrder open_order;
        open_order.order_id = "existing-" + symbol;
        open_order.symbol = symbol;
        open_order.side = Core::OrderSide::BUY;
        open_order.status = "new";
        open_orders.push_back(open_order);
    }

    int count_submitted(const std::string& symbol, Core::OrderSide side) const {
        int submitted_count = 0;
        for (const auto& request : submitted_orders) {
            if (request.symbol == symbol && request.side == side) {
                ++submitted_count;
            }
        }
        return submitted_count;
    }
};

} // namespace Testing
} // namespace ReinvestTrader

#endif // FAKE_BROKERAGE_HPP
