#include "system_manager.hpp"
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include "api/alpaca/alpaca_trading_client.hpp"
#include "api/sheets/csv_tabular_store.hpp"
#include "api/sheets/google_sheets_client.hpp"
#include "configs/config_loader.hpp"
#include "logging/logs/system_logs.hpp"
#include "trader/trading_logic/trading_logic_structures.hpp"

using ReinvestTrader::Logging::SystemLogs;

namespace ReinvestTrader {
namespace System {

namespace {

constexpr const char* DEFAULT_CONFIG_PATH = "config/runtime_config.csv";
constexpr const char* CONFIG_PATH_ENVIRONMENT_VARIABLE = "REINVEST_TRADER_CONFIG";

void create_tabular_stores(const Config::SystemConfig& config, SystemModules& modules) {
    if (config.sheets.backend == Config::SheetsBackend::GOOGLE) {
        auto sheets_client = std::make_shared<API::GoogleSheetsClient>(config.sheets, config.alpaca.timeout_seconds);
        sheets_client->open();
        modules.screener_store = std::make_unique<API::GoogleWorksheet>(sheets_client, config.sheets.screener_tab);
        modules.log_store = std::make_unique<API::GoogleWorksheet>(sheets_client, config.sheets.log_tab);
    } else {
        modules.screener_store = std::make_unique<API::CsvTabularStore>(config.sheets.screener_csv_path);
        modules.log_store = std::make_unique<API::CsvTabularStore>(config.sheets.log_csv_path);
    }

    SystemLogs::log_store_opened("screener", modules.screener_store->get_store_name());
    SystemLogs::log_store_opened("log", modules.log_store->get_store_name());
}

} // anonymous namespace

std::string resolve_config_path(int argc, char* argv[]) {
    if (argc > 1 && argv[1] && argv[1][0] != '\0') {
        return argv[1];
    }

    const char* environment_path = std::getenv(CONFIG_PATH_ENVIRONMENT_VARIABLE);
    if (environment_path && environment_path[0] != '\0') {
        return environment_path;
    }

    return DEFAULT_CONFIG_PATH;
}

SystemInitializationResult initialize(const std::string& config_path) {
    SystemInitializationResult initialization_result;

    // Logging context must exist before config loading, which may log
    initialization_result.logging_context = std::make_unique<Logging::LoggingContext>();
    Logging::set_logging_context(*initialization_result.logging_context);

    try {
        SystemLogs::log_startup(config_path);

        int config_load_result = load_system_config(initialization_result.config, config_path);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error("Config load failed with result: " + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed");
        }

        std::string validation_error_message;
        bool configuration_valid = validate_config(initialization_result.config, validation_error_message);
        SystemLogs::log_configuration_validated(configuration_valid, validation_error_message);
        if (!configuration_valid) {
            throw std::runtime_error("System initialization failed: " + validation_error_message);
        }

        initialization_result.logger = Logging::start_run_logger(initialization_result.config);
        SystemLogs::log_configuration_table(initialization_result.config);
        if (initialization_result.config.flags.dry_run) {
            SystemLogs::log_dry_run_enabled();
        }
    } catch (const std::exception&) {
        // The context dies with this result; never leave the global pointer dangling
        if (initialization_result.logger) {
            Logging::stop_run_logger(*initialization_result.logger);
        }
        Logging::clear_logging_context();
        throw;
    }

    return initialization_result;
}

SystemModules create_trading_modules(const Config::SystemConfig& config) {
    SystemModules modules;

    modules.brokerage = std::make_unique<API::AlpacaTradingClient>(config.alpaca);
    SystemLogs::log_brokerage_ready(modules.brokerage->get_provider_name(), config.alpaca.base_url);

    create_tabular_stores(config, modules);

    modules.pacing_policy = std::make_unique<Core::FixedDelayPacing>(config.timing.order_spacing_milliseconds);
    modules.audit_log = std::make_unique<Core::OrderAuditLog>(*modules.log_store);

    Core::OrderSubmitterConstructionParams submitter_params(*modules.brokerage, *modules.audit_log,
                                                            *modules.pacing_policy, config.flags.dry_run);
    modules.order_submitter = std::make_unique<Core::OrderSubmitter>(submitter_params);

    modules.account_manager = std::make_unique<Core::AccountManager>(*modules.brokerage);
    modules.ledger_store = std::make_unique<Core::ProfitLedgerStore>(*modules.log_store, config.rules.ledger_sentinel_key);
    modules.signal_source = std::make_unique<Core::ScreenerSignalSource>(*modules.screener_store);

    Core::TradingCoordinatorConstructionParams coordinator_params(config, *modules.account_manager, *modules.order_submitter,
                                                                  *modules.ledger_store, *modules.signal_source);
    modules.trading_coordinator = std::make_unique<Core::TradingCoordinator>(coordinator_params);

    return modules;
}

int run(SystemInitializationResult& initialization_result) {
    try {
        SystemModules modules = create_trading_modules(initialization_result.config);
        Core::RunSummary run_summary = modules.trading_coordinator->execute_trading_run();

        if (!run_summary.dry_run && !run_summary.ledger_persisted) {
            SystemLogs::log_fatal_error("Profit ledger was not saved: " + run_summary.ledger_persist_error);
            return 1;
        }
        return 0;
    } catch (const Core::AccountUnavailableError& account_exception_error) {
        SystemLogs::log_account_unavailable(account_exception_error.what());
        return 1;
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(exception_error.what());
        return 1;
    }
}

void shutdown(SystemInitializationResult& initialization_result) {
    if (initialization_result.logger) {
        Logging::stop_run_logger(*initialization_result.logger);
    }
    Logging::clear_logging_context();
}

} // namespace System
} // namespace ReinvestTrader
