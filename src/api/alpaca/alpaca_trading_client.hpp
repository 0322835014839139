#ifndef ALPACA_TRADING_CLIENT_HPP
#define ALPACA_TRADING_CLIENT_HPP

#include "api/general/brokerage_interface.hpp"
#include "configs/api_config.hpp"
#include "utils/http_utils.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace API {

class AlpacaTradingClient : public BrokerageInterface {
private:
    Config::ApiProviderConfig config;

    HttpResponse make_authenticated_request(const std::string& request_url, const std::string& method,
                                            const std::string& request_body, int attempt_count) const;
    nlohmann::json get_json(const std::string& request_url) const;
    std::string build_url(const std::string& endpoint) const;

public:
    explicit AlpacaTradingClient(const Config::ApiProviderConfig& api_config);

    double get_buying_power() const override;
    std::vector<Core::Position> get_positions() const override;
    std::optional<Core::Position> get_position(const std::string& symbol) const override;
    std::vector<Core::OpenOrder> get_open_orders(const std::string& symbol, Core::OrderSide side) const override;
    Core::OrderSubmissionResult submit_market_order(const Core::MarketOrderRequest& request) const override;
    std::string get_provider_name() const override;

    // Response parsing, exposed for tests
    static double parse_buying_power(const nlohmann::json& account_json);
    static Core::Position parse_position(const nlohmann::json& position_json);
    static std::vector<Core::OpenOrder> parse_open_orders(const nlohmann::json& orders_json, const std::string& symbol, Core::OrderSide side);
    static nlohmann::json build_order_payload(const Core::MarketOrderRequest& request);
    static std::string extract_error_message(const HttpResponse& response);
};

} // namespace API
} // namespace ReinvestTrader

#endif // ALPACA_TRADING_CLIENT_HPP
