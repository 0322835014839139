// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace ReinvestTrader {
namespace Config {

struct LoggingConfig {
    std::string log_file = "reinvest_trader";        // Base name of the per-run log file under runtime_logs/
    bool console_output = true;                      // Echo log lines to stdout
    int logging_poll_interval_milliseconds = 100;    // Writer thread wake-up interval
};

} // namespace Config
} // namespace ReinvestTrader

#endif // LOGGING_CONFIG_HPP
