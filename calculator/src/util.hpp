#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::string trim(const std::string& str);
    
    // Parses a host-supplied number. Rejects empty input, trailing garbage,
    // non-finite values and nonzero literals that underflow to zero.
    std::optional<double> parse_double(const std::string& text);
}
