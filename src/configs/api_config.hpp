#ifndef API_CONFIG_HPP
#define API_CONFIG_HPP

#include <string>

namespace ReinvestTrader {
namespace Config {

struct ApiProviderConfig {
    std::string api_key;
    std::string api_secret;
    std::string base_url = "https://api.alpaca.markets";
    int retry_count = 3;                             // Transport retries for read requests
    int order_retry_count = 1;                       // Transport attempts for order submission (1 = no retry)
    int timeout_seconds = 30;
    bool enable_ssl_verification = true;
    int rate_limit_delay_ms = 100;

    struct EndpointConfig {
        std::string account = "/v2/account";
        std::string positions = "/v2/positions";
        std::string position_by_symbol = "/v2/positions/{symbol}";
        std::string orders = "/v2/orders";
    } endpoints;
};

} // namespace Config
} // namespace ReinvestTrader

#endif // API_CONFIG_HPP
