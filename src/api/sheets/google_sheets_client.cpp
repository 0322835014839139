#include "google_sheets_client.hpp"
#include "utils/http_utils.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace ReinvestTrader {
namespace API {

namespace {
const char* const SPREADSHEET_MIME_TYPE = "application/vnd.google-apps.spreadsheet";
}

GoogleSheetsClient::GoogleSheetsClient(const Config::SheetsConfig& sheets_config, int request_timeout_seconds)
    : config(sheets_config),
      timeout_seconds(request_timeout_seconds),
      auth(sheets_config.service_account_json, sheets_config.oauth_scope, request_timeout_seconds),
      spreadsheet_id(sheets_config.spreadsheet_id) {}

void GoogleSheetsClient::open() {
    if (!spreadsheet_id.empty()) {
        return;
    }
    if (config.spreadsheet_name.empty()) {
        throw std::runtime_error("Spreadsheet id or name is required to open the Google spreadsheet");
    }
    spreadsheet_id = resolve_spreadsheet_id_by_name(config.spreadsheet_name);
}

std::vector<TableRow> GoogleSheetsClient::get_values(const std::string& a1_range) {
    HttpRequest values_request(build_values_url(a1_range), build_auth_headers(false), 3, timeout_seconds);
    return parse_value_rows(parse_response(http_get(values_request), "read " + a1_range));
}

void GoogleSheetsClient::append_values(const std::string& a1_range, const TableRow& row) {
    json payload = {{"values", json::array({row})}};
    std::string request_url = build_values_url(a1_range) + ":append?valueInputOption=USER_ENTERED&insertDataOption=INSERT_ROWS";

    // Appends are not idempotent; a single transport attempt
    HttpRequest append_request(request_url, build_auth_headers(true), 1, timeout_seconds, true, 0, payload.dump());
    parse_response(http_post(append_request), "append to " + a1_range);
}

void GoogleSheetsClient::update_values(const std::string& a1_range, const TableRow& row) {
    json payload = {{"range", a1_range}, {"values", json::array({row})}};
    std::string request_url = build_values_url(a1_range) + "?valueInputOption=USER_ENTERED";

    HttpRequest update_request(request_url, build_auth_headers(true), 3, timeout_seconds, true, 100, payload.dump());
    parse_response(http_put(update_request), "update " + a1_range);
}

std::vector<std::string> GoogleSheetsClient::build_auth_headers(bool with_json_body) {
    std::vector<std::string> header_lines = {"Authorization: Bearer " + auth.get_access_token()};
    if (with_json_body) {
        header_lines.push_back("Content-Type: application/json");
    }
    return header_lines;
}

std::string GoogleSheetsClient::build_values_url(const std::string& a1_range) const {
    if (spreadsheet_id.empty()) {
        throw std::runtime_error("Google spreadsheet is not open");
    }
    return config.sheets_base_url + "/" + url_encode(spreadsheet_id) + "/values/" + url_encode(a1_range);
}

json GoogleSheetsClient::parse_response(const HttpResponse& response, const std::string& operation) const {
    json response_json;
    try {
        response_json = response.body.empty() ? json::object() : json::parse(response.body);
    } catch (const json::exception& parse_exception_error) {
        throw std::runtime_error("Google Sheets " + operation + " returned unparsable response (HTTP " +
                                 std::to_string(response.status_code) + "): " + parse_exception_error.what());
    }

    if (!response.is_success()) {
        std::string error_text = response.body.substr(0, 200);
        if (response_json.contains("error") && response_json["error"].is_object()) {
            error_text = response_json["error"].value("message", error_text);
        }
        throw std::runtime_error("Google Sheets " + operation + " failed with HTTP " +
                                 std::to_string(response.status_code) + ": " + error_text);
    }
    return response_json;
}

std::string GoogleSheetsClient::resolve_spreadsheet_id_by_name(const std::string& spreadsheet_name) {
    std::string escaped_name;
    for (char name_char : spreadsheet_name) {
        if (name_char == '\'' || name_char == '\\') {
            escaped_name.push_back('\\');
        }
        escaped_name.push_back(name_char);
    }

    std::string search_query = "name = '" + escaped_name + "' and mimeType = '" + SPREADSHEET_MIME_TYPE + "' and trashed = false";
    std::string request_url = config.drive_files_url + "?q=" + url_encode(search_query) +
                              "&fields=" + url_encode("files(id,name)") + "&pageSize=10";

    HttpRequest search_request(request_url, build_auth_headers(false), 3, timeout_seconds);
    json search_json = parse_response(http_get(search_request), "spreadsheet lookup for '" + spreadsheet_name + "'");

    if (!search_json.contains("files") || !search_json["files"].is_array() || search_json["files"].empty()) {
        throw std::runtime_error("Spreadsheet '" + spreadsheet_name + "' not found or not shared with " + auth.get_client_email());
    }

    const json& first_match = search_json["files"][0];
    if (!first_match.contains("id") || !first_match["id"].is_string()) {
        throw std::runtime_error("Drive search result for '" + spreadsheet_name + "' has no id");
    }
    return first_match["id"].get<std::string>();
}

std::string GoogleSheetsClient::quote_sheet_name(const std::string& tab_name) {
    std::string quoted_name = "'";
    for (char name_char : tab_name) {
        if (name_char == '\'') {
            quoted_name.push_back('\'');
        }
        quoted_name.push_back(name_char);
    }
    quoted_name.push_back('\'');
    return quoted_name;
}

std::string GoogleSheetsClient::column_number_to_letters(int column_number) {
    if (column_number < 1) {
        throw std::runtime_error("Column number must be 1 or greater, got " + std::to_string(column_number));
    }

    std::string column_letters;
    while (column_number > 0) {
        int remainder = (column_number - 1) % 26;
        column_letters.insert(column_letters.begin(), static_cast<char>('A' + remainder));
        column_number = (column_number - 1) / 26;
    }
    return column_letters;
}

std::vector<TableRow> GoogleSheetsClient::parse_value_rows(const json& value_range_json) {
    std::vector<TableRow> rows;
    if (!value_range_json.contains("values")) {
        return rows;
    }

    for (const auto& row_json : value_range_json["values"]) {
        TableRow row;
        for (const auto& cell_json : row_json) {
            if (cell_json.is_string()) {
                row.push_back(cell_json.get<std::string>());
            } else if (cell_json.is_null()) {
                row.push_back("");
            } else {
                row.push_back(cell_json.dump());
            }
        }
        rows.push_back(row);
    }
    return rows;
}

GoogleWorksheet::GoogleWorksheet(std::shared_ptr<GoogleSheetsClient> sheets_client, const std::string& worksheet_name)
    : client(std::move(sheets_client)), tab_name(worksheet_name) {
    if (!client) {
        throw std::runtime_error("Google Sheets client is required for worksheet " + worksheet_name);
    }
}

std::vector<TableRow> GoogleWorksheet::get_all_values() const {
    return client->get_values(GoogleSheetsClient::quote_sheet_name(tab_name));
}

void GoogleWorksheet::append_row(const TableRow& row) {
    client->append_values(GoogleSheetsClient::quote_sheet_name(tab_name), row);
}

void GoogleWorksheet::update_cell(int row_number, int column_number, const std::string& value) {
    if (row_number < 1) {
        throw std::runtime_error("Row number must be 1 or greater, got " + std::to_string(row_number));
    }
    std::string cell_range = GoogleSheetsClient::quote_sheet_name(tab_name) + "!" +
                             GoogleSheetsClient::column_number_to_letters(column_number) + std::to_string(row_number);
    client->update_values(cell_range, {value});
}

std::string GoogleWorksheet::get_store_name() const {
    return "google:" + tab_name;
}

} // namespace API
} // namespace ReinvestTrader
