#include "json_schemas.hpp"
#include "number_format.hpp"
#include <fmt/format.h>
#include <stdexcept>

SessionEdit SessionEdit::from_json(const nlohmann::json& j) {
    SessionEdit edit;
    edit.field = j.at("field").get<std::string>();
    
    const auto& value = j.at("value");
    if (value.is_string()) {
        edit.value = value.get<std::string>();
    } else if (value.is_number()) {
        edit.value = fmt::format("{}", value.get<double>());
    } else {
        throw std::invalid_argument("value must be a string or a number");
    }
    
    return edit;
}

nlohmann::json pool_to_json(const PoolState& pool) {
    return {
        {"liquidity", pool.liquidity()},
        {"price", pool.price()},
        {"base_reserves", pool.base_reserves()},
        {"quote_reserves", pool.quote_reserves()},
        {"invariant", pool.invariant()}
    };
}

nlohmann::json trade_to_json(const TradeResult& result) {
    return {
        {"price_delta", result.price_delta},
        {"base_wallet_delta", result.base_wallet_delta},
        {"quote_wallet_delta", result.quote_wallet_delta},
        {"base_fee_collected", result.base_fee_collected},
        {"quote_fee_collected", result.quote_fee_collected}
    };
}

nlohmann::json recompute_to_json(const RecomputeOutput& output) {
    nlohmann::json j;
    j["initial"] = pool_to_json(output.initial);
    j["final"] = pool_to_json(output.final_state);
    j["trade"] = trade_to_json(output.result);
    
    j["display"] = {
        {"initial_base_reserves", format_number(output.initial.base_reserves())},
        {"initial_quote_reserves", format_number(output.initial.quote_reserves())},
        {"final_base_reserves", format_number(output.final_state.base_reserves())},
        {"final_quote_reserves", format_number(output.final_state.quote_reserves())},
        {"price_delta", format_number(output.result.price_delta)},
        {"base_wallet_delta", format_number(output.result.base_wallet_delta)},
        {"quote_wallet_delta", format_number(output.result.quote_wallet_delta)},
        {"base_fee_collected", format_number(output.result.base_fee_collected)},
        {"quote_fee_collected", format_number(output.result.quote_fee_collected)}
    };
    
    return j;
}

nlohmann::json session_to_json(const CalculatorSession& session) {
    const auto& state = session.state();
    return {
        {"initial_liquidity", state.initial_liquidity},
        {"initial_price", state.initial_price},
        {"final_price", state.final_price},
        {"fee_percent", state.fee_percent},
        {"center_price", state.center_price},
        {"decades", state.decades},
        {"initial_slider", session.initial_slider()},
        {"final_slider", session.final_slider()},
        {"display", {
            {"initial_liquidity", format_number(state.initial_liquidity)},
            {"initial_price", format_number(state.initial_price)},
            {"final_price", format_number(state.final_price)},
            {"fee_percent", format_number(state.fee_percent)}
        }}
    };
}

SessionState session_state_from_json(const nlohmann::json& j, const SessionState& defaults) {
    SessionState state;
    state.initial_liquidity = j.value("initial_liquidity", defaults.initial_liquidity);
    state.initial_price = j.value("initial_price", defaults.initial_price);
    state.final_price = j.value("final_price", defaults.final_price);
    state.fee_percent = j.value("fee_percent", defaults.fee_percent);
    state.center_price = j.value("center_price", defaults.center_price);
    state.decades = j.value("decades", defaults.decades);
    return state;
}
