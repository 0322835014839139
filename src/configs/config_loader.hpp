#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns false if the file cannot be opened.
bool load_config_from_csv(ReinvestTrader::Config::SystemConfig& cfg, const std::string& csv_path);

// Overlay credentials and base URL from the process environment (APCA_*, GOOGLE_CREDS_*).
void apply_environment_overrides(ReinvestTrader::Config::SystemConfig& cfg);

// Load runtime config then environment overrides. Returns 0 on success, 1 on failure.
int load_system_config(ReinvestTrader::Config::SystemConfig& config, const std::string& config_path);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const ReinvestTrader::Config::SystemConfig& config, std::string& errorMessage);

#endif // CONFIG_LOADER_HPP
