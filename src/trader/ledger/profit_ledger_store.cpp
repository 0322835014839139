#include "profit_ledger_store.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/money_utils.hpp"
#include <stdexcept>

using ReinvestTrader::Logging::TradingLogs;

namespace ReinvestTrader {
namespace Core {

ProfitLedgerStore::ProfitLedgerStore(API::TabularStoreInterface& log_store_ref, const std::string& ledger_sentinel_key)
    : log_store(log_store_ref), sentinel_key(ledger_sentinel_key) {
    if (sentinel_key.empty()) {
        throw std::runtime_error("Ledger sentinel key is required but not provided");
    }
}

ProfitLedger ProfitLedgerStore::load() const {
    try {
        auto ledger_row = find_ledger_row(log_store.get_all_values(), sentinel_key);
        if (!ledger_row) {
            TradingLogs::log_ledger_loaded(0.0, false);
            return ProfitLedger(0.0);
        }

        double stored_funds = parse_ledger_value(ledger_row->raw_value);
        if (stored_funds < 0.0) {
            TradingLogs::log_ledger_read_failed("negative balance " + ledger_row->raw_value + " treated as zero");
            return ProfitLedger(0.0);
        }

        TradingLogs::log_ledger_loaded(stored_funds, true);
        return ProfitLedger(stored_funds);
    } catch (const std::exception& exception_error) {
        TradingLogs::log_ledger_read_failed(exception_error.what());
        return ProfitLedger(0.0);
    }
}

void ProfitLedgerStore::save(const ProfitLedger& ledger) {
    std::string persisted_value = MoneyUtils::format_cents(ledger.get_persisted_value());

    auto ledger_row = find_ledger_row(log_store.get_all_values(), sentinel_key);
    if (ledger_row) {
        log_store.update_cell(ledger_row->row_number, 2, persisted_value);
    } else {
        log_store.append_row({sentinel_key, persisted_value});
    }
}

std::optional<ProfitLedgerStore::LedgerRowLocation> ProfitLedgerStore::find_ledger_row(const std::vector<API::TableRow>& rows, const std::string& key) {
    for (size_t row_index = 0; row_index < rows.size(); ++row_index) {
        const API::TableRow& row = rows[row_index];
        if (row.size() >= 2 && row[0] == key) {
            LedgerRowLocation location;
            location.row_number = static_cast<int>(row_index) + 1;
            location.raw_value = row[1];
            return location;
        }
    }
    return std::nullopt;
}

double ProfitLedgerStore::parse_ledger_value(const std::string& raw_value) {
    // Sheets may render the cell with currency formatting
    std::string numeric_text;
    for (char value_char : raw_value) {
        if (value_char != '$' && value_char != ',') {
            numeric_text.push_back(value_char);
        }
    }
    return MoneyUtils::parse_decimal(numeric_text);
}

} // namespace Core
} // namespace ReinvestTrader
