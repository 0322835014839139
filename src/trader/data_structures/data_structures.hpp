#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <vector>
#include <optional>

namespace ReinvestTrader {
namespace Core {

enum class OrderSide { BUY, SELL };

inline std::string order_side_to_string(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

// Candidate symbol surfaced by the screener feed
struct Signal {
    std::string symbol;
    std::optional<double> reference_price;
};

// Held quantity of a symbol as reported by the broker
struct Position {
    std::string symbol;
    double quantity;
    double average_entry_price;
    double current_price;

    Position() : quantity(0.0), average_entry_price(0.0), current_price(0.0) {}
    Position(const std::string& symbol_param, double quantity_param, double entry_param, double current_param)
        : symbol(symbol_param), quantity(quantity_param), average_entry_price(entry_param), current_price(current_param) {}
};

// Submitted order not yet filled or canceled
struct OpenOrder {
    std::string order_id;
    std::string symbol;
    OrderSide side;
    std::string status;

    OpenOrder() : side(OrderSide::BUY) {}
};

struct AccountSnapshot {
    double buying_power;
    std::vector<Position> positions;
    bool positions_available;          // false when the positions read failed; liquidation then scans nothing
    std::string positions_error;

    AccountSnapshot() : buying_power(0.0), positions_available(false) {}
};

// Market, day time-in-force. Buys carry a notional amount, sells a share quantity.
struct MarketOrderRequest {
    std::string symbol;
    OrderSide side;
    std::optional<double> notional;
    std::optional<double> quantity;

    static MarketOrderRequest buy_notional(const std::string& symbol_param, double notional_amount) {
        MarketOrderRequest request;
        request.symbol = symbol_param;
        request.side = OrderSide::BUY;
        request.notional = notional_amount;
        return request;
    }

    static MarketOrderRequest sell_quantity(const std::string& symbol_param, double share_quantity) {
        MarketOrderRequest request;
        request.symbol = symbol_param;
        request.side = OrderSide::SELL;
        request.quantity = share_quantity;
        return request;
    }

private:
    MarketOrderRequest() : side(OrderSide::BUY) {}
};

struct OrderSubmissionResult {
    bool succeeded;
    std::string order_id;
    std::string error_message;

    OrderSubmissionResult() : succeeded(false) {}

    static OrderSubmissionResult ok(const std::string& order_id_param) {
        OrderSubmissionResult result;
        result.succeeded = true;
        result.order_id = order_id_param;
        return result;
    }

    static OrderSubmissionResult failed(const std::string& error_param) {
        OrderSubmissionResult result;
        result.error_message = error_param;
        return result;
    }
};

// One row of the audit log. Immutable once appended.
struct OrderAttempt {
    std::string timestamp;
    std::string symbol;
    OrderSide side;
    std::optional<double> notional;
    std::optional<double> quantity;
    std::optional<double> reference_price;
    std::string order_id;
    bool succeeded;
    std::string error_message;

    OrderAttempt() : side(OrderSide::BUY), succeeded(false) {}
};

} // namespace Core
} // namespace ReinvestTrader

#endif // DATA_STRUCTURES_HPP
