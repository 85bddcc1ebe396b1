#include "slider_mapper.hpp"
#include <cmath>

double SliderMapper::slider_to_price(double slider_value, double center_price, double decades) {
    double exponent = (slider_value - CENTER) * 2.0 * decades;
    return center_price * std::pow(10.0, exponent);
}

double SliderMapper::price_to_slider(double price, double center_price, double decades) {
    if (price <= 0.0 || center_price <= 0.0) {
        return CENTER;
    }
    
    double exponent = std::log10(price / center_price);
    return CENTER + exponent / (2.0 * decades);
}
