#pragma once

#include <string>

class NumberFormatter {
public:
    // Display rendering only, lossy:
    //   0 < |v| < 1e-4   -> scientific, 6 digits (1.234000e-5)
    //   |v| >= 1e6       -> scientific, 4 digits (1.0000e6)
    //   otherwise        -> fixed, 6 digits
    static std::string format(double value);
    
private:
    static constexpr double SMALL_THRESHOLD = 0.0001;
    static constexpr double LARGE_THRESHOLD = 1000000.0;
};

inline std::string format_number(double value) {
    return NumberFormatter::format(value);
}
