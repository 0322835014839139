#include "money_utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace MoneyUtils {

double round_to_cents(double amount) {
    // printf rounds the exact binary value, so only true ties (10.125) go to even
    char cents_text[64];
    std::snprintf(cents_text, sizeof(cents_text), "%.2f", amount);
    double rounded = std::strtod(cents_text, nullptr);
    // Avoid "-0.00" in logs and sheet cells
    return rounded == 0.0 ? 0.0 : rounded;
}

std::string format_cents(double amount) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << round_to_cents(amount);
    return oss.str();
}

std::string format_quantity(double quantity) {
    std::ostringstream oss;
    oss << std::setprecision(15) << quantity;
    return oss.str();
}

double parse_decimal(const std::string& text) {
    size_t parsed_length = 0;
    double parsed_value = std::stod(text, &parsed_length);
    while (parsed_length < text.size() && std::isspace(static_cast<unsigned char>(text[parsed_length]))) {
        ++parsed_length;
    }
    if (parsed_length != text.size() || !std::isfinite(parsed_value)) {
        throw std::invalid_argument("Not a decimal: '" + text + "'");
    }
    return parsed_value;
}

} // namespace MoneyUtils
