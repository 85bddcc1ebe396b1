#pragma once

// Maps a slider coordinate to a price on a log10 axis. The 0..1 sweep runs
// from center_price * 10^-decades to center_price * 10^decades, with 0.5
// pinned to center_price.
class SliderMapper {
public:
    // Total over all real slider values; values outside [0, 1] extrapolate
    static double slider_to_price(double slider_value, double center_price, double decades);
    
    // Returns 0.5 when price or center_price is not positive
    static double price_to_slider(double price, double center_price, double decades);
    
    static constexpr double CENTER = 0.5;
};
