#include "config_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

using ReinvestTrader::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    inline std::string read_environment(const char* variable_name) {
        const char* variable_value = std::getenv(variable_name);
        return variable_value ? std::string(variable_value) : std::string();
    }

    std::string read_whole_file(const std::string& file_path) {
        std::ifstream file_stream(file_path);
        if (!file_stream.is_open()) {
            throw std::runtime_error("Cannot open credentials file: " + file_path);
        }
        std::stringstream content_stream;
        content_stream << file_stream.rdbuf();
        return content_stream.str();
    }
}

bool load_config_from_csv(ReinvestTrader::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    int line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        ++line_number;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;
        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) continue;
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        try {
            // Portfolio rules
            if (config_key_string == "rules.dividend_symbol") cfg.rules.dividend_symbol = config_value_string;
            else if (config_key_string == "rules.profit_target") cfg.rules.profit_target = std::stod(config_value_string);
            else if (config_key_string == "rules.sizing_fraction") cfg.rules.sizing_fraction = std::stod(config_value_string);
            else if (config_key_string == "rules.minimum_reinvest_threshold") cfg.rules.minimum_reinvest_threshold = std::stod(config_value_string);
            else if (config_key_string == "rules.minimum_order_notional") cfg.rules.minimum_order_notional = std::stod(config_value_string);
            else if (config_key_string == "rules.ledger_sentinel_key") cfg.rules.ledger_sentinel_key = config_value_string;

            // Timing
            else if (config_key_string == "timing.order_spacing_milliseconds") cfg.timing.order_spacing_milliseconds = std::stoi(config_value_string);

            // Alpaca
            else if (config_key_string == "alpaca.api_key") cfg.alpaca.api_key = config_value_string;
            else if (config_key_string == "alpaca.api_secret") cfg.alpaca.api_secret = config_value_string;
            else if (config_key_string == "alpaca.base_url") cfg.alpaca.base_url = config_value_string;
            else if (config_key_string == "alpaca.retry_count") cfg.alpaca.retry_count = std::stoi(config_value_string);
            else if (config_key_string == "alpaca.order_retry_count") cfg.alpaca.order_retry_count = std::stoi(config_value_string);
            else if (config_key_string == "alpaca.timeout_seconds") cfg.alpaca.timeout_seconds = std::stoi(config_value_string);
            else if (config_key_string == "alpaca.enable_ssl_verification") cfg.alpaca.enable_ssl_verification = to_bool(config_value_string);
            else if (config_key_string == "alpaca.rate_limit_delay_ms") cfg.alpaca.rate_limit_delay_ms = std::stoi(config_value_string);
            else if (config_key_string == "alpaca.endpoints.account") cfg.alpaca.endpoints.account = config_value_string;
            else if (config_key_string == "alpaca.endpoints.positions") cfg.alpaca.endpoints.positions = config_value_string;
            else if (config_key_string == "alpaca.endpoints.position_by_symbol") cfg.alpaca.endpoints.position_by_symbol = config_value_string;
            else if (config_key_string == "alpaca.endpoints.orders") cfg.alpaca.endpoints.orders = config_value_string;

            // Sheets
            else if (config_key_string == "sheets.backend") cfg.sheets.backend = ReinvestTrader::Config::SheetsConfig::parse_backend(config_value_string);
            else if (config_key_string == "sheets.spreadsheet_name") cfg.sheets.spreadsheet_name = config_value_string;
            else if (config_key_string == "sheets.spreadsheet_id") cfg.sheets.spreadsheet_id = config_value_string;
            else if (config_key_string == "sheets.screener_tab") cfg.sheets.screener_tab = config_value_string;
            else if (config_key_string == "sheets.log_tab") cfg.sheets.log_tab = config_value_string;
            else if (config_key_string == "sheets.screener_csv_path") cfg.sheets.screener_csv_path = config_value_string;
            else if (config_key_string == "sheets.log_csv_path") cfg.sheets.log_csv_path = config_value_string;

            // Logging
            else if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
            else if (config_key_string == "logging.console_output") cfg.logging.console_output = to_bool(config_value_string);
            else if (config_key_string == "logging.logging_poll_interval_milliseconds") cfg.logging.logging_poll_interval_milliseconds = std::stoi(config_value_string);

            // Flags
            else if (config_key_string == "flags.dry_run") cfg.flags.dry_run = to_bool(config_value_string);
        } catch (const std::exception& value_exception_error) {
            throw std::runtime_error("Invalid value for " + config_key_string + " at " + csv_path + ":" +
                                     std::to_string(line_number) + " (" + value_exception_error.what() + ")");
        }
    }
    return true;
}

void apply_environment_overrides(ReinvestTrader::Config::SystemConfig& cfg) {
    std::string api_key_value = read_environment("APCA_API_KEY_ID");
    if (!api_key_value.empty()) cfg.alpaca.api_key = api_key_value;

    std::string api_secret_value = read_environment("APCA_API_SECRET_KEY");
    if (!api_secret_value.empty()) cfg.alpaca.api_secret = api_secret_value;

    std::string base_url_value = read_environment("APCA_API_BASE_URL");
    if (!base_url_value.empty()) cfg.alpaca.base_url = base_url_value;

    std::string credentials_json_value = read_environment("GOOGLE_CREDS_JSON");
    if (!credentials_json_value.empty()) {
        cfg.sheets.service_account_json = credentials_json_value;
    } else {
        std::string credentials_file_value = read_environment("GOOGLE_CREDS_FILE");
        if (!credentials_file_value.empty()) {
            cfg.sheets.service_account_json = read_whole_file(credentials_file_value);
        }
    }
}

int load_system_config(ReinvestTrader::Config::SystemConfig& config, const std::string& config_path) {
    try {
        if (!load_config_from_csv(config, config_path)) {
            log_message("Failed to load config CSV from " + config_path, "");
            return 1;
        }
        apply_environment_overrides(config);
    } catch (const std::exception& config_exception_error) {
        log_message("Configuration error: " + std::string(config_exception_error.what()), "");
        return 1;
    }
    return 0;
}

bool validate_config(const ReinvestTrader::Config::SystemConfig& config, std::string& errorMessage) {
    if (config.alpaca.api_key.empty() || config.alpaca.api_secret.empty()) {
        errorMessage = "Alpaca credentials missing (set APCA_API_KEY_ID and APCA_API_SECRET_KEY)";
        return false;
    }
    if (config.alpaca.base_url.empty()) {
        errorMessage = "alpaca.base_url is empty";
        return false;
    }
    if (config.alpaca.retry_count < 1 || config.alpaca.order_retry_count < 1) {
        errorMessage = "alpaca.retry_count and alpaca.order_retry_count must be >= 1";
        return false;
    }
    if (config.rules.dividend_symbol.empty()) {
        errorMessage = "rules.dividend_symbol is empty";
        return false;
    }
    if (config.rules.ledger_sentinel_key.empty()) {
        errorMessage = "rules.ledger_sentinel_key is empty";
        return false;
    }
    if (config.rules.profit_target <= 0.0) {
        errorMessage = "rules.profit_target must be > 0";
        return false;
    }
    if (config.rules.sizing_fraction <= 0.0 || config.rules.sizing_fraction > 1.0) {
        errorMessage = "rules.sizing_fraction must be in (0, 1]";
        return false;
    }
    if (config.rules.minimum_reinvest_threshold < 0.0 || config.rules.minimum_order_notional < 0.0) {
        errorMessage = "rules.minimum_* thresholds must be >= 0";
        return false;
    }
    if (config.timing.order_spacing_milliseconds < 0) {
        errorMessage = "timing.order_spacing_milliseconds must be >= 0";
        return false;
    }
    if (config.sheets.backend == ReinvestTrader::Config::SheetsBackend::GOOGLE) {
        if (config.sheets.service_account_json.empty()) {
            errorMessage = "Google service account credentials missing (set GOOGLE_CREDS_JSON or GOOGLE_CREDS_FILE)";
            return false;
        }
        if (config.sheets.spreadsheet_id.empty() && config.sheets.spreadsheet_name.empty()) {
            errorMessage = "sheets.spreadsheet_id or sheets.spreadsheet_name is required";
            return false;
        }
    } else {
        if (config.sheets.screener_csv_path.empty() || config.sheets.log_csv_path.empty()) {
            errorMessage = "sheets.screener_csv_path and sheets.log_csv_path are required for the csv backend";
            return false;
        }
    }
    if (config.sheets.screener_tab.empty() || config.sheets.log_tab.empty()) {
        errorMessage = "sheets.screener_tab and sheets.log_tab are required";
        return false;
    }
    return true;
}
