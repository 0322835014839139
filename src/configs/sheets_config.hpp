#ifndef SHEETS_CONFIG_HPP
#define SHEETS_CONFIG_HPP

#include <string>
#include <stdexcept>

namespace ReinvestTrader {
namespace Config {

enum class SheetsBackend {
    GOOGLE,
    CSV
};

struct SheetsConfig {
    SheetsBackend backend = SheetsBackend::GOOGLE;

    // Google Sheets backend
    std::string spreadsheet_name = "Trading Log";
    std::string spreadsheet_id;                      // Resolved by name through Drive when empty
    std::string screener_tab = "screener";
    std::string log_tab = "log";
    std::string service_account_json;                // Raw key file contents (GOOGLE_CREDS_JSON)
    std::string sheets_base_url = "https://sheets.googleapis.com/v4/spreadsheets";
    std::string drive_files_url = "https://www.googleapis.com/drive/v3/files";
    std::string oauth_scope = "https://www.googleapis.com/auth/spreadsheets https://www.googleapis.com/auth/drive.readonly";

    // CSV backend
    std::string screener_csv_path;
    std::string log_csv_path;

    static SheetsBackend parse_backend(const std::string& backend_str) {
        if (backend_str == "google" || backend_str == "GOOGLE") {
            return SheetsBackend::GOOGLE;
        } else if (backend_str == "csv" || backend_str == "CSV") {
            return SheetsBackend::CSV;
        } else {
            throw std::runtime_error("Invalid sheets backend: " + backend_str + ". Must be 'google' or 'csv'");
        }
    }

    static std::string backend_to_string(SheetsBackend backend_value) {
        switch (backend_value) {
            case SheetsBackend::GOOGLE:
                return "google";
            case SheetsBackend::CSV:
                return "csv";
            default:
                throw std::runtime_error("Unknown sheets backend");
        }
    }
};

} // namespace Config
} // namespace ReinvestTrader

#endif // SHEETS_CONFIG_HPP
