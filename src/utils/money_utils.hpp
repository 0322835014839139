#ifndef MONEY_UTILS_HPP
#define MONEY_UTILS_HPP

#include <string>

namespace MoneyUtils {

// Nearest whole cent of the exact binary value; exact ties go to the even cent (10.125 -> 10.12).
double round_to_cents(double amount);

// Fixed two-decimal rendering, e.g. 50 -> "50.00".
std::string format_cents(double amount);

// Shortest decimal rendering that round-trips a share quantity ("3", "0.5", "12.345").
std::string format_quantity(double quantity);

// Parse a decimal that may arrive as a JSON string ("12.5") or number. Throws std::invalid_argument on garbage.
double parse_decimal(const std::string& text);

} // namespace MoneyUtils

#endif // MONEY_UTILS_HPP
