#include "alpaca_trading_client.hpp"
#include "utils/http_utils.hpp"
#include "utils/money_utils.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace ReinvestTrader {
namespace API {

namespace {

// Alpaca serializes decimals as strings; tolerate plain numbers too
double read_decimal_field(const json& object_json, const std::string& field_name) {
    if (!object_json.contains(field_name) || object_json[field_name].is_null()) {
        throw std::runtime_error("Field '" + field_name + "' missing from Alpaca response");
    }
    const json& field_value = object_json[field_name];
    if (field_value.is_string()) {
        return MoneyUtils::parse_decimal(field_value.get<std::string>());
    }
    if (field_value.is_number()) {
        return field_value.get<double>();
    }
    throw std::runtime_error("Field '" + field_name + "' has unexpected type in Alpaca response");
}

} // anonymous namespace

AlpacaTradingClient::AlpacaTradingClient(const Config::ApiProviderConfig& api_config)
    : config(api_config) {
    if (config.api_key.empty()) {
        throw std::runtime_error("Alpaca API key is required but not provided");
    }

    if (config.api_secret.empty()) {
        throw std::runtime_error("Alpaca API secret is required but not provided");
    }

    if (config.base_url.empty()) {
        throw std::runtime_error("Alpaca base URL is required but not provided");
    }
}

double AlpacaTradingClient::get_buying_power() const {
    return parse_buying_power(get_json(build_url(config.endpoints.account)));
}

std::vector<Core::Position> AlpacaTradingClient::get_positions() const {
    json positions_json = get_json(build_url(config.endpoints.positions));
    if (!positions_json.is_array()) {
        throw std::runtime_error("Invalid response format from Alpaca positions API - expected array");
    }

    std::vector<Core::Position> positions;
    for (const auto& position_json : positions_json) {
        positions.push_back(parse_position(position_json));
    }
    return positions;
}

std::optional<Core::Position> AlpacaTradingClient::get_position(const std::string& symbol) const {
    if (symbol.empty()) {
        throw std::runtime_error("Symbol is required for position lookup");
    }

    std::string request_url = replace_url_placeholder(build_url(config.endpoints.position_by_symbol), url_encode(symbol));
    HttpResponse response = make_authenticated_request(request_url, "GET", "", config.retry_count);
    if (response.status_code == 404) {
        return std::nullopt;
    }
    if (!response.is_success()) {
        throw std::runtime_error("Alpaca position lookup for " + symbol + " failed: " + extract_error_message(response));
    }

    try {
        return parse_position(json::parse(response.body));
    } catch (const json::exception& parse_exception_error) {
        throw std::runtime_error("Failed to parse Alpaca position response: " + std::string(parse_exception_error.what()));
    }
}

std::vector<Core::OpenOrder> AlpacaTradingClient::get_open_orders(const std::string& symbol, Core::OrderSide side) const {
    if (symbol.empty()) {
        throw std::runtime_error("Symbol is required for open order lookup");
    }

    std::string request_url = build_url(config.endpoints.orders) + "?status=open&symbols=" + url_encode(symbol);
    return parse_open_orders(get_json(request_url), symbol, side);
}

Core::OrderSubmissionResult AlpacaTradingClient::submit_market_order(const Core::MarketOrderRequest& request) const {
    try {
        json order_payload = build_order_payload(request);
        HttpResponse response = make_authenticated_request(build_url(config.endpoints.orders), "POST",
                                                           order_payload.dump(), config.order_retry_count);
        if (!response.is_success()) {
            return Core::OrderSubmissionResult::failed(extract_error_message(response));
        }

        json response_json = json::parse(response.body);
        if (!response_json.contains("id") || !response_json["id"].is_string()) {
            return Core::OrderSubmissionResult::failed("Order response missing id: " + response.body.substr(0, 200));
        }
        return Core::OrderSubmissionResult::ok(response_json["id"].get<std::string>());
    } catch (const std::exception& exception_error) {
        return Core::OrderSubmissionResult::failed(exception_error.what());
    }
}

std::string AlpacaTradingClient::get_provider_name() const {
    return "Alpaca Trading";
}

double AlpacaTradingClient::parse_buying_power(const json& account_json) {
    if (account_json.contains("code") && account_json.contains("message")) {
        throw std::runtime_error("API returned error: " + account_json["message"].get<std::string>());
    }
    return read_decimal_field(account_json, "buying_power");
}

Core::Position AlpacaTradingClient::parse_position(const json& position_json) {
    if (!position_json.contains("symbol") || !position_json["symbol"].is_string()) {
        throw std::runtime_error("Position entry missing symbol");
    }

    Core::Position position;
    position.symbol = position_json["symbol"].get<std::string>();
    position.quantity = read_decimal_field(position_json, "qty");
    position.average_entry_price = read_decimal_field(position_json, "avg_entry_price");
    position.current_price = read_decimal_field(position_json, "current_price");
    return position;
}

std::vector<Core::OpenOrder> AlpacaTradingClient::parse_open_orders(const json& orders_json, const std::string& symbol, Core::OrderSide side) {
    if (!orders_json.is_array()) {
        throw std::runtime_error("Invalid response format from Alpaca orders API - expected array");
    }

    std::vector<Core::OpenOrder> open_orders;
    std::string wanted_side = Core::order_side_to_string(side);
    for (const auto& order_json : orders_json) {
        if (order_json.value("symbol", "") != symbol || order_json.value("side", "") != wanted_side) {
            continue;
        }
        Core::OpenOrder open_order;
        open_order.order_id = order_json.value("id", "");
        open_order.symbol = symbol;
        open_order.side = side;
        open_order.status = order_json.value("status", "");
        open_orders.push_back(open_order);
    }
    return open_orders;
}

json AlpacaTradingClient::build_order_payload(const Core::MarketOrderRequest& request) {
    if (request.symbol.empty()) {
        throw std::runtime_error("Symbol is required for order submission");
    }

    json order = json::object();
    order["symbol"] = request.symbol;
    order["side"] = Core::order_side_to_string(request.side);
    order["type"] = "market";
    order["time_in_force"] = "day";

    if (request.side == Core::OrderSide::BUY) {
        if (!request.notional || *request.notional <= 0.0) {
            throw std::runtime_error("Buy orders require a positive notional amount");
        }
        order["notional"] = MoneyUtils::format_cents(*request.notional);
    } else {
        if (!request.quantity || *request.quantity <= 0.0) {
            throw std::runtime_error("Sell orders require a positive quantity");
        }
        order["qty"] = MoneyUtils::format_quantity(*request.quantity);
    }
    return order;
}

std::string AlpacaTradingClient::extract_error_message(const HttpResponse& response) {
    try {
        json response_json = json::parse(response.body);
        if (response_json.is_object() && response_json.contains("message") && response_json["message"].is_string()) {
            return response_json["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw body
    }
    std::string body_excerpt = response.body.substr(0, 200);
    return "HTTP " + std::to_string(response.status_code) + (body_excerpt.empty() ? "" : ": " + body_excerpt);
}

json AlpacaTradingClient::get_json(const std::string& request_url) const {
    HttpResponse response = make_authenticated_request(request_url, "GET", "", config.retry_count);
    if (!response.is_success()) {
        throw std::runtime_error("Alpaca API GET " + request_url + " failed: " + extract_error_message(response));
    }
    if (response.body.empty()) {
        throw std::runtime_error("Alpaca API GET " + request_url + " returned empty response");
    }

    try {
        return json::parse(response.body);
    } catch (const json::exception& parse_exception_error) {
        throw std::runtime_error("Failed to parse Alpaca response from " + request_url + ": " + std::string(parse_exception_error.what()));
    }
}

HttpResponse AlpacaTradingClient::make_authenticated_request(const std::string& request_url, const std::string& method,
                                                             const std::string& body, int attempt_count) const {
    if (request_url.empty()) {
        throw std::runtime_error("URL is required for authenticated request");
    }

    std::vector<std::string> header_lines = {
        "APCA-API-KEY-ID: " + config.api_key,
        "APCA-API-SECRET-KEY: " + config.api_secret
    };
    if (method == "POST") {
        header_lines.push_back("Content-Type: application/json");
    }

    HttpRequest http_request(request_url, header_lines, attempt_count, config.timeout_seconds,
                             config.enable_ssl_verification, config.rate_limit_delay_ms, body);

    std::string error_context = "Alpaca API " + method + " request to " + request_url;
    try {
        if (method == "GET") {
            return http_get(http_request);
        } else if (method == "POST") {
            return http_post(http_request);
        }
        throw std::runtime_error("Unsupported HTTP method: " + method);
    } catch (const std::exception& exception_error) {
        throw std::runtime_error(error_context + " failed: " + std::string(exception_error.what()));
    }
}

std::string AlpacaTradingClient::build_url(const std::string& endpoint) const {
    if (endpoint.empty()) {
        throw std::runtime_error("Endpoint is required for URL construction");
    }

    return config.base_url + endpoint;
}

} // namespace API
} // namespace ReinvestTrader
