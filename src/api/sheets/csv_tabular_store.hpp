#ifndef CSV_TABULAR_STORE_HPP
#define CSV_TABULAR_STORE_HPP

#include "api/sheets/tabular_store_interface.hpp"
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace API {

/**
 * Tabular store over a local CSV file, for offline runs.
 * Fields containing commas, quotes or newlines are double-quoted on write and
 * unquoted on read. A missing file reads as an empty table and is created on
 * the first write.
 */
class CsvTabularStore : public TabularStoreInterface {
private:
    std::string file_path;

    void write_all_rows(const std::vector<TableRow>& rows) const;

public:
    explicit CsvTabularStore(const std::string& csv_file_path);

    std::vector<TableRow> get_all_values() const override;
    void append_row(const TableRow& row) override;
    void update_cell(int row_number, int column_number, const std::string& value) override;
    std::string get_store_name() const override;

    static std::vector<TableRow> parse_csv(const std::string& csv_text);
    static std::string format_csv_row(const TableRow& row);
};

} // namespace API
} // namespace ReinvestTrader

#endif // CSV_TABULAR_STORE_HPP
