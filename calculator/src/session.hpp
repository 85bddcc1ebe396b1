#pragma once

#include "pool_state.hpp"
#include "trade_engine.hpp"
#include <string>

// Editable calculator inputs. All prices and liquidity > 0, decades > 0,
// fee_percent in [0, 100).
struct SessionState {
    double initial_liquidity = 1000.0;
    double initial_price = 1.0;
    double final_price = 1.1;
    double fee_percent = 0.3;
    double center_price = 1.0;
    double decades = 3.0;
    
    bool is_valid() const;
};

struct RecomputeOutput {
    PoolState initial;
    PoolState final_state;
    TradeResult result;
};

// Both pool states share the session liquidity: the trade is a price move at
// constant L. Throws std::invalid_argument on a state that breaks the invariants.
RecomputeOutput recompute(const SessionState& session);

enum class SessionField {
    InitialLiquidity,
    InitialPrice,
    InitialSlider,
    FinalPrice,
    FinalSlider,
    FeePercent,
    CenterPrice,
    Decades,
    Unknown
};

SessionField parse_session_field(const std::string& name);
std::string session_field_name(SessionField field);

// Owns one session and enforces the field-level edit contract. Every setter
// returns false and leaves the session untouched when the value is rejected.
class CalculatorSession {
public:
    explicit CalculatorSession(const SessionState& defaults = SessionState());
    
    bool set_initial_liquidity(double value);
    bool set_initial_price(double value);
    bool set_final_price(double value);
    bool set_initial_slider(double value);
    bool set_final_slider(double value);
    bool set_fee_percent(double value);
    bool set_center_price(double value);
    bool set_decades(double value);
    
    // Raw host input: parsed with util::parse_double, then dispatched by field
    bool apply(SessionField field, const std::string& raw_value);
    bool apply(const std::string& field_name, const std::string& raw_value);
    
    void reset(const SessionState& defaults);
    
    RecomputeOutput recompute() const;
    
    const SessionState& state() const { return state_; }
    double initial_slider() const { return initial_slider_; }
    double final_slider() const { return final_slider_; }
    
private:
    SessionState state_;
    double initial_slider_;
    double final_slider_;
    
    bool apply_value(SessionField field, double value);
    bool slider_price(double slider_value, double& price) const;
    bool price_slider(double price, double center_price, double decades, double& slider) const;
    
    // Re-derives both slider positions for a calibration; false leaves them untouched
    bool sync_sliders(double center_price, double decades);
};
