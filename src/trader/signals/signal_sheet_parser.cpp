#include "signal_sheet_parser.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/money_utils.hpp"
#include <algorithm>
#include <cctype>

using ReinvestTrader::Logging::TradingLogs;

namespace ReinvestTrader {
namespace Core {

namespace {

std::string trim_cell(const std::string& cell_value) {
    const char* whitespace_chars = " \t\r\n";
    auto begin_position = cell_value.find_first_not_of(whitespace_chars);
    auto end_position = cell_value.find_last_not_of(whitespace_chars);
    if (begin_position == std::string::npos) return "";
    return cell_value.substr(begin_position, end_position - begin_position + 1);
}

std::optional<size_t> find_column(const API::TableRow& header_row, const std::string& header_name) {
    for (size_t column_index = 0; column_index < header_row.size(); ++column_index) {
        if (trim_cell(header_row[column_index]) == header_name) {
            return column_index;
        }
    }
    return std::nullopt;
}

// Short rows read missing cells as empty
std::string cell_at(const API::TableRow& row, size_t column_index) {
    return column_index < row.size() ? trim_cell(row[column_index]) : std::string();
}

} // anonymous namespace

std::vector<Signal> SignalSheetParser::parse_rows(const std::vector<API::TableRow>& rows) {
    std::vector<Signal> signals;
    if (rows.empty()) {
        return signals;
    }

    const API::TableRow& header_row = rows.front();
    if (!has_required_headers(header_row)) {
        return signals;
    }
    auto top_pick_column = find_column(header_row, TOP_PICK_HEADER);
    auto bullish_column = find_column(header_row, BULLISH_SIGNAL_HEADER);
    auto ticker_column = find_column(header_row, TICKER_HEADER);
    auto price_column = find_column(header_row, PRICE_HEADER);

    for (size_t row_index = 1; row_index < rows.size(); ++row_index) {
        const API::TableRow& row = rows[row_index];
        if (!is_eligible(cell_at(row, *top_pick_column), cell_at(row, *bullish_column))) {
            continue;
        }

        Signal signal;
        signal.symbol = cell_at(row, *ticker_column);
        signal.reference_price = parse_reference_price(cell_at(row, *price_column));
        signals.push_back(signal);
    }
    return signals;
}

bool SignalSheetParser::has_required_headers(const API::TableRow& header_row) {
    return find_column(header_row, TOP_PICK_HEADER) && find_column(header_row, BULLISH_SIGNAL_HEADER) &&
           find_column(header_row, TICKER_HEADER) && find_column(header_row, PRICE_HEADER);
}

bool SignalSheetParser::is_eligible(const std::string& top_pick_cell, const std::string& bullish_signal_cell) {
    std::string top_pick_upper = trim_cell(top_pick_cell);
    std::transform(top_pick_upper.begin(), top_pick_upper.end(), top_pick_upper.begin(),
                   [](unsigned char cell_char) { return static_cast<char>(std::toupper(cell_char)); });
    return top_pick_upper.rfind("TOP", 0) == 0 && trim_cell(bullish_signal_cell) == BULLISH_MARK;
}

std::optional<double> SignalSheetParser::parse_reference_price(const std::string& price_cell) {
    std::string price_text = trim_cell(price_cell);
    if (price_text.empty()) {
        return std::nullopt;
    }
    try {
        return MoneyUtils::parse_decimal(price_text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

ScreenerSignalSource::ScreenerSignalSource(API::TabularStoreInterface& screener_store_ref)
    : screener_store(screener_store_ref) {}

std::vector<Signal> ScreenerSignalSource::read_signals() const {
    std::vector<API::TableRow> rows;
    try {
        rows = screener_store.get_all_values();
    } catch (const std::exception& exception_error) {
        TradingLogs::log_signal_source_unavailable(screener_store.get_store_name() + ": " + exception_error.what());
        return {};
    }

    if (rows.empty() || !SignalSheetParser::has_required_headers(rows.front())) {
        TradingLogs::log_signal_source_unavailable(screener_store.get_store_name() + ": required screener columns missing");
        return {};
    }
    return SignalSheetParser::parse_rows(rows);
}

} // namespace Core
} // namespace ReinvestTrader
