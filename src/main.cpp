// main.cpp
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include <curl/curl.h>
#include <iostream>

using namespace ReinvestTrader::System;

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Fatal error: failed to initialize libcurl" << std::endl;
        return 1;
    }

    int exit_code = 1;
    SystemInitializationResult initialization_result;
    try {
        // Config, validation and logger; any failure stops the run before trading
        initialization_result = initialize(resolve_config_path(argc, argv));

        exit_code = run(initialization_result);
        ReinvestTrader::Logging::SystemLogs::log_shutdown_complete(exit_code);
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        exit_code = 1;
    }

    shutdown(initialization_result);
    curl_global_cleanup();
    return exit_code;
}
