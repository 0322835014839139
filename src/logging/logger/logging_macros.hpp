#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <algorithm>
#include <string>

// Standard indentation levels
#define LOG_INDENT_L1 ""                    // Section level
#define LOG_INDENT_L2 "|   "                // Content level
#define LOG_INDENT_L3 "|     "              // Sub-content level

// Section headers and footers
#define LOG_SECTION_HEADER(title) ReinvestTrader::Logging::log_message(LOG_INDENT_L1 "+-- " + std::string(title), "")
#define LOG_SECTION_FOOTER() ReinvestTrader::Logging::log_message(LOG_INDENT_L1 "+-- ", "")

// Content logging macros
#define LOG_CONTENT(msg) ReinvestTrader::Logging::log_message(LOG_INDENT_L2 + std::string(msg), "")
#define LOG_SUBCONTENT(msg) ReinvestTrader::Logging::log_message(LOG_INDENT_L3 + std::string(msg), "")

// Specialized section headers for the three decision steps
#define LOG_LIQUIDATION_HEADER() LOG_SECTION_HEADER("POSITION LIQUIDATION")
#define LOG_REINVESTMENT_HEADER() LOG_SECTION_HEADER("PROFIT REINVESTMENT")
#define LOG_ACQUISITION_HEADER() LOG_SECTION_HEADER("SIGNAL ACQUISITION")
#define LOG_ORDER_RESULT(msg) LOG_SUBCONTENT("ORDER RESULT: " + std::string(msg))

// Run banner (special case - no indentation)
#define LOG_RUN_HEADER(title) \
    ReinvestTrader::Logging::log_message("", ""); \
    ReinvestTrader::Logging::log_message("================================================================================", ""); \
    ReinvestTrader::Logging::log_message("                           " + std::string(title), ""); \
    ReinvestTrader::Logging::log_message("================================================================================", ""); \
    ReinvestTrader::Logging::log_message("", "")

// Two-column table used for run summaries and startup configuration
#define TABLE_HEADER_30(title, subtitle) do { \
    LOG_CONTENT("+-------------------+--------------------------------+"); \
    LOG_CONTENT("| " + std::string(title).substr(0,17) + std::string(17 - std::min<size_t>(17, std::string(title).length()), ' ') + " | " + std::string(subtitle).substr(0,30) + std::string(30 - std::min<size_t>(30, std::string(subtitle).length()), ' ') + " |"); \
    LOG_CONTENT("+-------------------+--------------------------------+"); \
} while(0)

#define TABLE_ROW_30(label, value) do { \
    std::string label_str = std::string(label).substr(0,17); \
    std::string value_str = std::string(value).substr(0,30); \
    LOG_CONTENT("| " + label_str + std::string(17 - label_str.length(), ' ') + " | " + value_str + std::string(30 - value_str.length(), ' ') + " |"); \
} while(0)

#define TABLE_FOOTER_30() do { \
    LOG_CONTENT("+-------------------+--------------------------------+"); \
} while(0)

#endif // LOGGING_MACROS_HPP
