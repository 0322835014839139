#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "configs/system_config.hpp"
#include "system/system_modules.hpp"
#include "logging/logger/async_logger.hpp"

namespace ReinvestTrader {
namespace System {

struct SystemInitializationResult {
    Config::SystemConfig config;
    std::unique_ptr<Logging::LoggingContext> logging_context;
    std::shared_ptr<Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Config file path from the command line, then REINVEST_TRADER_CONFIG, then the default
std::string resolve_config_path(int argc, char* argv[]);

// Loads and validates configuration, then starts the run's logger. Throws on any failure.
SystemInitializationResult initialize(const std::string& config_path);

// Builds the brokerage, the stores and the decision engine for one run
SystemModules create_trading_modules(const Config::SystemConfig& config);

// One decision run. Returns the process exit code.
int run(SystemInitializationResult& initialization_result);

void shutdown(SystemInitializationResult& initialization_result);

} // namespace System
} // namespace ReinvestTrader

#endif // SYSTEM_MANAGER_HPP
