#pragma once

#include "session.hpp"
#include <string>
#include <nlohmann/json.hpp>

struct SessionEdit {
    std::string field;
    std::string value;  // raw host text; numbers are rendered with full precision
    
    static SessionEdit from_json(const nlohmann::json& j);
};

nlohmann::json pool_to_json(const PoolState& pool);
nlohmann::json trade_to_json(const TradeResult& result);

// Numeric output plus a "display" block rendered with format_number
nlohmann::json recompute_to_json(const RecomputeOutput& output);

nlohmann::json session_to_json(const CalculatorSession& session);

// Stateless recompute body; absent keys fall back to defaults
SessionState session_state_from_json(const nlohmann::json& j, const SessionState& defaults);
