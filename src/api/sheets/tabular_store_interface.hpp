#ifndef TABULAR_STORE_INTERFACE_HPP
#define TABULAR_STORE_INTERFACE_HPP

#include <memory>
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace API {

using TableRow = std::vector<std::string>;

/**
 * One worksheet of a spreadsheet-like store. Row and column numbers are
 * 1-based, matching A1 notation. Failures throw std::runtime_error.
 */
class TabularStoreInterface {
public:
    virtual ~TabularStoreInterface() = default;

    // Rows in sheet order, header first. Blank interior rows come back empty so
    // that row numbers stay aligned with update_cell; ragged rows keep their own length.
    virtual std::vector<TableRow> get_all_values() const = 0;

    virtual void append_row(const TableRow& row) = 0;

    virtual void update_cell(int row_number, int column_number, const std::string& value) = 0;

    virtual std::string get_store_name() const = 0;
};

using TabularStorePtr = std::unique_ptr<TabularStoreInterface>;

} // namespace API
} // namespace ReinvestTrader

#endif // TABULAR_STORE_INTERFACE_HPP
