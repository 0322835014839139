#ifndef GOOGLE_SHEETS_CLIENT_HPP
#define GOOGLE_SHEETS_CLIENT_HPP

#include "api/sheets/tabular_store_interface.hpp"
#include "api/sheets/google_service_account_auth.hpp"
#include "utils/http_utils.hpp"
#include "configs/sheets_config.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace API {

/**
 * Authenticated access to one spreadsheet through the Sheets v4 values API.
 * The spreadsheet is addressed by id; when none is configured it is looked up
 * by name through the Drive v3 files search.
 */
class GoogleSheetsClient {
private:
    Config::SheetsConfig config;
    int timeout_seconds;
    GoogleServiceAccountAuth auth;
    std::string spreadsheet_id;

    std::vector<std::string> build_auth_headers(bool with_json_body);
    std::string build_values_url(const std::string& a1_range) const;
    nlohmann::json parse_response(const HttpResponse& response, const std::string& operation) const;
    std::string resolve_spreadsheet_id_by_name(const std::string& spreadsheet_name);

public:
    GoogleSheetsClient(const Config::SheetsConfig& sheets_config, int request_timeout_seconds);

    // Resolves the spreadsheet id; throws when it cannot be found or the credentials are rejected
    void open();

    std::vector<TableRow> get_values(const std::string& a1_range);
    void append_values(const std::string& a1_range, const TableRow& row);
    void update_values(const std::string& a1_range, const TableRow& row);

    const std::string& get_spreadsheet_id() const { return spreadsheet_id; }

    static std::string quote_sheet_name(const std::string& tab_name);
    static std::string column_number_to_letters(int column_number);
    static std::vector<TableRow> parse_value_rows(const nlohmann::json& value_range_json);
};

/**
 * One tab of a Google spreadsheet behind the tabular store interface.
 */
class GoogleWorksheet : public TabularStoreInterface {
private:
    std::shared_ptr<GoogleSheetsClient> client;
    std::string tab_name;

public:
    GoogleWorksheet(std::shared_ptr<GoogleSheetsClient> sheets_client, const std::string& worksheet_name);

    std::vector<TableRow> get_all_values() const override;
    void append_row(const TableRow& row) override;
    void update_cell(int row_number, int column_number, const std::string& value) override;
    std::string get_store_name() const override;
};

} // namespace API
} // namespace ReinvestTrader

#endif // GOOGLE_SHEETS_CLIENT_HPP
