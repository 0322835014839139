#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"

namespace ReinvestTrader {
namespace Logging {

namespace {

std::string mask_credential(const std::string& credential_value) {
    if (credential_value.empty()) {
        return "(not set)";
    }
    if (credential_value.size() <= 4) {
        return "****";
    }
    return credential_value.substr(0, 4) + "****";
}

} // anonymous namespace

void SystemLogs::log_startup(const std::string& config_path) {
    log_message("SYSTEM_STARTUP: Starting trading bot with config " + config_path, "");
}

void SystemLogs::log_shutdown_complete(int exit_code) {
    log_message("SYSTEM_SHUTDOWN: Run finished with exit code " + std::to_string(exit_code), "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

void SystemLogs::log_account_unavailable(const std::string& error_message) {
    log_message("FATAL: Account unavailable, no orders sent and ledger left unchanged: " + error_message, "");
}

void SystemLogs::log_configuration_validated(bool valid, const std::string& error_message) {
    if (valid) {
        log_message("CONFIG_VALIDATION: Configuration validated successfully", "");
    } else {
        log_message("CONFIG_VALIDATION: Configuration validation FAILED - " + error_message, "");
    }
}

void SystemLogs::log_configuration_table(const Config::SystemConfig& config) {
    LOG_SECTION_HEADER("CONFIGURATION");
    TABLE_HEADER_30("Setting", "Value");
    TABLE_ROW_30("Alpaca base URL", config.alpaca.base_url);
    TABLE_ROW_30("Alpaca key", mask_credential(config.alpaca.api_key));
    TABLE_ROW_30("Sheets backend", Config::SheetsConfig::backend_to_string(config.sheets.backend));
    if (config.sheets.backend == Config::SheetsBackend::GOOGLE) {
        TABLE_ROW_30("Spreadsheet", config.sheets.spreadsheet_id.empty() ? config.sheets.spreadsheet_name : config.sheets.spreadsheet_id);
        TABLE_ROW_30("Screener tab", config.sheets.screener_tab);
        TABLE_ROW_30("Log tab", config.sheets.log_tab);
    } else {
        TABLE_ROW_30("Screener CSV", config.sheets.screener_csv_path);
        TABLE_ROW_30("Log CSV", config.sheets.log_csv_path);
    }
    TABLE_ROW_30("Dry run", config.flags.dry_run ? "YES" : "NO");
    TABLE_FOOTER_30();
    LOG_SECTION_FOOTER();
}

void SystemLogs::log_dry_run_enabled() {
    log_message("WARNING: Dry run enabled - orders will not be sent and the ledger will not be saved", "");
}

void SystemLogs::log_store_opened(const std::string& store_role, const std::string& store_name) {
    log_message("Opened " + store_role + " store " + store_name, "");
}

void SystemLogs::log_brokerage_ready(const std::string& provider_name, const std::string& base_url) {
    log_message("Brokerage ready: " + provider_name + " at " + base_url, "");
}

} // namespace Logging
} // namespace ReinvestTrader
