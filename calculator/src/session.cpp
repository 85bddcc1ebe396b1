#include "session.hpp"
#include "slider_mapper.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace {

bool is_positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

bool is_valid_fee_percent(double value) {
    return std::isfinite(value) && value >= 0.0 && value < 100.0;
}

} // namespace

bool SessionState::is_valid() const {
    return is_positive(initial_liquidity)
        && is_positive(initial_price)
        && is_positive(final_price)
        && is_positive(center_price)
        && is_positive(decades)
        && is_valid_fee_percent(fee_percent);
}

RecomputeOutput recompute(const SessionState& session) {
    PoolState initial = make_pool_state(session.initial_liquidity, session.initial_price);
    PoolState final_state = make_pool_state(session.initial_liquidity, session.final_price);
    TradeResult result = TradeEngine::compute_trade(initial, final_state,
                                                    session.fee_percent / 100.0);
    return RecomputeOutput{initial, final_state, result};
}

SessionField parse_session_field(const std::string& name) {
    if (name == "initial_liquidity") return SessionField::InitialLiquidity;
    if (name == "initial_price") return SessionField::InitialPrice;
    if (name == "initial_slider") return SessionField::InitialSlider;
    if (name == "final_price") return SessionField::FinalPrice;
    if (name == "final_slider") return SessionField::FinalSlider;
    if (name == "fee_percent") return SessionField::FeePercent;
    if (name == "center_price") return SessionField::CenterPrice;
    if (name == "decades") return SessionField::Decades;
    return SessionField::Unknown;
}

std::string session_field_name(SessionField field) {
    switch (field) {
        case SessionField::InitialLiquidity: return "initial_liquidity";
        case SessionField::InitialPrice: return "initial_price";
        case SessionField::InitialSlider: return "initial_slider";
        case SessionField::FinalPrice: return "final_price";
        case SessionField::FinalSlider: return "final_slider";
        case SessionField::FeePercent: return "fee_percent";
        case SessionField::CenterPrice: return "center_price";
        case SessionField::Decades: return "decades";
        default: return "unknown";
    }
}

CalculatorSession::CalculatorSession(const SessionState& defaults)
    : state_(defaults)
    , initial_slider_(SliderMapper::CENTER)
    , final_slider_(SliderMapper::CENTER)
{
    if (!state_.is_valid() || !sync_sliders(state_.center_price, state_.decades)) {
        throw std::invalid_argument("Session defaults violate input invariants");
    }
}

bool CalculatorSession::set_initial_liquidity(double value) {
    if (!is_positive(value)) {
        spdlog::debug("Rejected initial_liquidity={}", value);
        return false;
    }
    state_.initial_liquidity = value;
    return true;
}

bool CalculatorSession::set_initial_price(double value) {
    double slider = 0.0;
    if (!is_positive(value) || !price_slider(value, state_.center_price, state_.decades, slider)) {
        spdlog::debug("Rejected initial_price={}", value);
        return false;
    }
    state_.initial_price = value;
    initial_slider_ = slider;
    return true;
}

bool CalculatorSession::set_final_price(double value) {
    double slider = 0.0;
    if (!is_positive(value) || !price_slider(value, state_.center_price, state_.decades, slider)) {
        spdlog::debug("Rejected final_price={}", value);
        return false;
    }
    state_.final_price = value;
    final_slider_ = slider;
    return true;
}

bool CalculatorSession::price_slider(double price, double center_price, double decades,
                                     double& slider) const {
    // A price far from the center can push the log ratio to infinity
    double derived = SliderMapper::price_to_slider(price, center_price, decades);
    if (!std::isfinite(derived)) return false;
    
    slider = derived;
    return true;
}

bool CalculatorSession::slider_price(double slider_value, double& price) const {
    if (!std::isfinite(slider_value)) return false;
    
    // Far outside [0, 1] the derived price can overflow or underflow to zero
    double derived = SliderMapper::slider_to_price(slider_value, state_.center_price,
                                                   state_.decades);
    if (!is_positive(derived)) return false;
    
    price = derived;
    return true;
}

bool CalculatorSession::set_initial_slider(double value) {
    double price = 0.0;
    if (!slider_price(value, price)) {
        spdlog::debug("Rejected initial_slider={}", value);
        return false;
    }
    initial_slider_ = value;
    state_.initial_price = price;
    return true;
}

bool CalculatorSession::set_final_slider(double value) {
    double price = 0.0;
    if (!slider_price(value, price)) {
        spdlog::debug("Rejected final_slider={}", value);
        return false;
    }
    final_slider_ = value;
    state_.final_price = price;
    return true;
}

bool CalculatorSession::set_fee_percent(double value) {
    if (!is_valid_fee_percent(value)) {
        spdlog::debug("Rejected fee_percent={}", value);
        return false;
    }
    state_.fee_percent = value;
    return true;
}

bool CalculatorSession::set_center_price(double value) {
    if (!is_positive(value) || !sync_sliders(value, state_.decades)) {
        spdlog::debug("Rejected center_price={}", value);
        return false;
    }
    state_.center_price = value;
    spdlog::info("Slider recentred at {}", value);
    return true;
}

bool CalculatorSession::set_decades(double value) {
    if (!is_positive(value) || !sync_sliders(state_.center_price, value)) {
        spdlog::debug("Rejected decades={}", value);
        return false;
    }
    state_.decades = value;
    spdlog::info("Slider span set to {} decades", value);
    return true;
}

bool CalculatorSession::apply_value(SessionField field, double value) {
    switch (field) {
        case SessionField::InitialLiquidity: return set_initial_liquidity(value);
        case SessionField::InitialPrice: return set_initial_price(value);
        case SessionField::InitialSlider: return set_initial_slider(value);
        case SessionField::FinalPrice: return set_final_price(value);
        case SessionField::FinalSlider: return set_final_slider(value);
        case SessionField::FeePercent: return set_fee_percent(value);
        case SessionField::CenterPrice: return set_center_price(value);
        case SessionField::Decades: return set_decades(value);
        default: return false;
    }
}

bool CalculatorSession::apply(SessionField field, const std::string& raw_value) {
    if (field == SessionField::Unknown) {
        spdlog::debug("Rejected edit of unknown field");
        return false;
    }
    
    auto value = util::parse_double(raw_value);
    if (!value) {
        spdlog::debug("Rejected {}: '{}' is not a number",
                      session_field_name(field), raw_value);
        return false;
    }
    
    return apply_value(field, *value);
}

bool CalculatorSession::apply(const std::string& field_name, const std::string& raw_value) {
    return apply(parse_session_field(field_name), raw_value);
}

void CalculatorSession::reset(const SessionState& defaults) {
    if (!defaults.is_valid()) {
        throw std::invalid_argument("Session defaults violate input invariants");
    }
    
    SessionState previous = state_;
    state_ = defaults;
    if (!sync_sliders(state_.center_price, state_.decades)) {
        state_ = previous;
        throw std::invalid_argument("Session defaults put a slider out of range");
    }
}

RecomputeOutput CalculatorSession::recompute() const {
    return ::recompute(state_);
}

bool CalculatorSession::sync_sliders(double center_price, double decades) {
    double initial_slider = 0.0;
    double final_slider = 0.0;
    if (!price_slider(state_.initial_price, center_price, decades, initial_slider)
        || !price_slider(state_.final_price, center_price, decades, final_slider)) {
        return false;
    }
    initial_slider_ = initial_slider;
    final_slider_ = final_slider;
    return true;
}
