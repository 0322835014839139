#ifndef SIGNAL_SHEET_PARSER_HPP
#define SIGNAL_SHEET_PARSER_HPP

#include "api/sheets/tabular_store_interface.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ReinvestTrader {
namespace Core {

/**
 * Turns screener rows into signals. Columns are located by header name in
 * the first row; a row qualifies when its TopPick cell starts with "TOP"
 * (case-insensitive) and its Bullish Signal cell is exactly the check mark.
 */
class SignalSheetParser {
public:
    static constexpr const char* TOP_PICK_HEADER = "TopPick";
    static constexpr const char* BULLISH_SIGNAL_HEADER = "Bullish Signal";
    static constexpr const char* TICKER_HEADER = "Ticker";
    static constexpr const char* PRICE_HEADER = "Price";
    static constexpr const char* BULLISH_MARK = "\xE2\x9C\x85";   // U+2705 WHITE HEAVY CHECK MARK

    // Empty when any required header is missing
    static std::vector<Signal> parse_rows(const std::vector<API::TableRow>& rows);

    static bool has_required_headers(const API::TableRow& header_row);
    static bool is_eligible(const std::string& top_pick_cell, const std::string& bullish_signal_cell);
    static std::optional<double> parse_reference_price(const std::string& price_cell);
};

// Reads the screener tab; failures yield no signals
class ScreenerSignalSource {
private:
    API::TabularStoreInterface& screener_store;

public:
    explicit ScreenerSignalSource(API::TabularStoreInterface& screener_store_ref);

    std::vector<Signal> read_signals() const;
};

} // namespace Core
} // namespace ReinvestTrader

#endif // SIGNAL_SHEET_PARSER_HPP
