#include "csv_tabular_store.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ReinvestTrader {
namespace API {

CsvTabularStore::CsvTabularStore(const std::string& csv_file_path) : file_path(csv_file_path) {
    if (file_path.empty()) {
        throw std::runtime_error("CSV store path is required but not provided");
    }
}

std::vector<TableRow> CsvTabularStore::get_all_values() const {
    if (!std::filesystem::exists(file_path)) {
        return {};
    }

    std::ifstream csv_stream(file_path, std::ios::binary);
    if (!csv_stream.is_open()) {
        throw std::runtime_error("Cannot open CSV store for reading: " + file_path);
    }
    std::stringstream content_stream;
    content_stream << csv_stream.rdbuf();
    return parse_csv(content_stream.str());
}

void CsvTabularStore::append_row(const TableRow& row) {
    bool needs_leading_newline = false;
    if (std::filesystem::exists(file_path) && std::filesystem::file_size(file_path) > 0) {
        std::ifstream tail_stream(file_path, std::ios::binary);
        tail_stream.seekg(-1, std::ios::end);
        char last_char = '\n';
        tail_stream.get(last_char);
        needs_leading_newline = last_char != '\n';
    }

    std::ofstream csv_stream(file_path, std::ios::binary | std::ios::app);
    if (!csv_stream.is_open()) {
        throw std::runtime_error("Cannot open CSV store for append: " + file_path);
    }
    if (needs_leading_newline) {
        csv_stream << '\n';
    }
    csv_stream << format_csv_row(row) << '\n';
    if (!csv_stream) {
        throw std::runtime_error("Failed to append row to CSV store: " + file_path);
    }
}

void CsvTabularStore::update_cell(int row_number, int column_number, const std::string& value) {
    if (row_number < 1 || column_number < 1) {
        throw std::runtime_error("Cell coordinates must be 1-based, got row " + std::to_string(row_number) +
                                 " column " + std::to_string(column_number));
    }

    std::vector<TableRow> rows = get_all_values();
    if (static_cast<size_t>(row_number) > rows.size()) {
        rows.resize(row_number);
    }
    TableRow& target_row = rows[row_number - 1];
    if (static_cast<size_t>(column_number) > target_row.size()) {
        target_row.resize(column_number);
    }
    target_row[column_number - 1] = value;
    write_all_rows(rows);
}

std::string CsvTabularStore::get_store_name() const {
    return "csv:" + file_path;
}

void CsvTabularStore::write_all_rows(const std::vector<TableRow>& rows) const {
    // Write beside the target then rename so a crash never leaves a half-written file
    std::string temporary_path = file_path + ".tmp";
    {
        std::ofstream csv_stream(temporary_path, std::ios::binary | std::ios::trunc);
        if (!csv_stream.is_open()) {
            throw std::runtime_error("Cannot open CSV store for writing: " + temporary_path);
        }
        for (const auto& row : rows) {
            csv_stream << format_csv_row(row) << '\n';
        }
        if (!csv_stream) {
            throw std::runtime_error("Failed to write CSV store: " + temporary_path);
        }
    }

    std::error_code rename_error;
    std::filesystem::rename(temporary_path, file_path, rename_error);
    if (rename_error) {
        throw std::runtime_error("Failed to replace CSV store " + file_path + ": " + rename_error.message());
    }
}

std::vector<TableRow> CsvTabularStore::parse_csv(const std::string& csv_text) {
    std::vector<TableRow> rows;
    TableRow current_row;
    std::string current_field;
    bool inside_quotes = false;
    bool row_has_content = false;

    for (size_t char_index = 0; char_index < csv_text.size(); ++char_index) {
        char current_char = csv_text[char_index];

        if (inside_quotes) {
            if (current_char == '"') {
                if (char_index + 1 < csv_text.size() && csv_text[char_index + 1] == '"') {
                    current_field.push_back('"');
                    ++char_index;
                } else {
                    inside_quotes = false;
                }
            } else {
                current_field.push_back(current_char);
            }
            continue;
        }

        if (current_char == '"') {
            inside_quotes = true;
            row_has_content = true;
        } else if (current_char == ',') {
            current_row.push_back(current_field);
            current_field.clear();
            row_has_content = true;
        } else if (current_char == '\r') {
            continue;
        } else if (current_char == '\n') {
            if (row_has_content || !current_field.empty()) {
                current_row.push_back(current_field);
            }
            rows.push_back(current_row);
            current_row.clear();
            current_field.clear();
            row_has_content = false;
        } else {
            current_field.push_back(current_char);
            row_has_content = true;
        }
    }

    if (inside_quotes) {
        throw std::runtime_error("Unterminated quoted field in CSV data");
    }
    if (row_has_content || !current_field.empty()) {
        current_row.push_back(current_field);
        rows.push_back(current_row);
    }
    return rows;
}

std::string CsvTabularStore::format_csv_row(const TableRow& row) {
    std::string formatted_line;
    for (size_t column_index = 0; column_index < row.size(); ++column_index) {
        if (column_index > 0) {
            formatted_line.push_back(',');
        }
        const std::string& field_value = row[column_index];
        if (field_value.find_first_of(",\"\r\n") == std::string::npos) {
            formatted_line += field_value;
            continue;
        }
        formatted_line.push_back('"');
        for (char field_char : field_value) {
            if (field_char == '"') {
                formatted_line.push_back('"');
            }
            formatted_line.push_back(field_char);
        }
        formatted_line.push_back('"');
    }
    return formatted_line;
}

} // namespace API
} // namespace ReinvestTrader
