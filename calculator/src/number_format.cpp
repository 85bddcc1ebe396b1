#include "number_format.hpp"
#include <fmt/format.h>
#include <cmath>

namespace {

// "1.234000e-05" -> "1.234000e-5", "1.0000e+06" -> "1.0000e6"
std::string compact_exponent(const std::string& text) {
    size_t e = text.find('e');
    if (e == std::string::npos) return text;
    
    std::string result = text.substr(0, e + 1);
    size_t pos = e + 1;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        if (text[pos] == '-') result += '-';
        ++pos;
    }
    
    size_t digits = text.find_first_not_of('0', pos);
    if (digits == std::string::npos) return result + "0";
    return result + text.substr(digits);
}

} // namespace

std::string NumberFormatter::format(double value) {
    double magnitude = std::fabs(value);
    
    if (magnitude < SMALL_THRESHOLD && value != 0.0) {
        return compact_exponent(fmt::format("{:.6e}", value));
    }
    if (magnitude >= LARGE_THRESHOLD) {
        return compact_exponent(fmt::format("{:.4e}", value));
    }
    return fmt::format("{:.6f}", value);
}
