#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <cstdlib>
#include <cerrno>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::optional<double> parse_double(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return std::nullopt;
    
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    
    if (end != trimmed.c_str() + trimmed.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    
    // Underflow to a subnormal is kept; underflow all the way to zero is not
    if (errno == ERANGE && value == 0.0) return std::nullopt;
    
    return value;
}

} // namespace util
