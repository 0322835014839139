#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include "configs/system_config.hpp"
#include <string>

namespace ReinvestTrader {
namespace Logging {

/**
 * Specialized logging for process startup, configuration and shutdown.
 */
class SystemLogs {
public:
    // Startup and shutdown
    static void log_startup(const std::string& config_path);
    static void log_shutdown_complete(int exit_code);
    static void log_fatal_error(const std::string& error_message);
    static void log_account_unavailable(const std::string& error_message);

    // Configuration
    static void log_configuration_validated(bool valid, const std::string& error_message = "");
    static void log_configuration_table(const Config::SystemConfig& config);
    static void log_dry_run_enabled();

    // Collaborators
    static void log_store_opened(const std::string& store_role, const std::string& store_name);
    static void log_brokerage_ready(const std::string& provider_name, const std::string& base_url);
};

} // namespace Logging
} // namespace ReinvestTrader

#endif // SYSTEM_LOGS_HPP
