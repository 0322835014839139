#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "portfolio_rules_config.hpp"
#include "timing_config.hpp"
#include "logging_config.hpp"
#include "api_config.hpp"
#include "sheets_config.hpp"

namespace ReinvestTrader {
namespace Config {

struct FlagsConfig {
    bool dry_run = false;                            // Log decisions without sending orders or persisting the ledger
};

/**
 * Main trading system configuration.
 * Rules config holds every portfolio decision parameter; the rest is infrastructure.
 */
struct SystemConfig {
    SystemConfig() {}

    PortfolioRulesConfig rules;        // Profit target, sizing, reinvestment instrument
    TimingConfig timing;               // Order pacing
    LoggingConfig logging;             // Logging configuration
    ApiProviderConfig alpaca;          // Brokerage credentials and endpoints
    SheetsConfig sheets;               // Signal feed and audit log store
    FlagsConfig flags;
};

} // namespace Config
} // namespace ReinvestTrader

#endif // SYSTEM_CONFIG_HPP
