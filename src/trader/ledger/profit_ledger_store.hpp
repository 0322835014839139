#ifndef PROFIT_LEDGER_STORE_HPP
#define PROFIT_LEDGER_STORE_HPP

#include "api/sheets/tabular_store_interface.hpp"
#include "trader/ledger/profit_ledger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace Core {

/**
 * Persists the profit ledger as a key/value row inside the audit log tab:
 * the sentinel key in column 1, the balance in column 2.
 */
class ProfitLedgerStore {
private:
    API::TabularStoreInterface& log_store;
    std::string sentinel_key;

public:
    ProfitLedgerStore(API::TabularStoreInterface& log_store_ref, const std::string& ledger_sentinel_key);

    // Zero when the row is absent, unparsable, negative or the store cannot be read
    ProfitLedger load() const;

    // Updates the first sentinel row in place or appends one. Throws std::runtime_error on store failure.
    void save(const ProfitLedger& ledger);

    // 1-based row number and parsed value of the first sentinel row
    struct LedgerRowLocation {
        int row_number;
        std::string raw_value;
    };
    static std::optional<LedgerRowLocation> find_ledger_row(const std::vector<API::TableRow>& rows, const std::string& key);
    static double parse_ledger_value(const std::string& raw_value);
};

} // namespace Core
} // namespace ReinvestTrader

#endif // PROFIT_LEDGER_STORE_HPP
