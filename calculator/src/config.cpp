#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    
    auto parsed = util::parse_double(val);
    if (!parsed) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
    return *parsed;
}

Config Config::from_env() {
    Config cfg;
    SessionState defaults;
    
    cfg.initial_liquidity = get_env_double("CPMM_INITIAL_LIQUIDITY", defaults.initial_liquidity);
    cfg.initial_price = get_env_double("CPMM_INITIAL_PRICE", defaults.initial_price);
    cfg.final_price = get_env_double("CPMM_FINAL_PRICE", defaults.final_price);
    cfg.fee_percent = get_env_double("CPMM_FEE_PERCENT", defaults.fee_percent);
    
    cfg.center_price = get_env_double("CPMM_CENTER_PRICE", defaults.center_price);
    cfg.decades = get_env_double("CPMM_DECADES", defaults.decades);
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    
    cfg.service_name = get_env("SERVICE_NAME", "cpmm_calc");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

SessionState Config::session_defaults() const {
    SessionState state;
    state.initial_liquidity = initial_liquidity;
    state.initial_price = initial_price;
    state.final_price = final_price;
    state.fee_percent = fee_percent;
    state.center_price = center_price;
    state.decades = decades;
    return state;
}

void Config::validate() const {
    if (!session_defaults().is_valid()) {
        throw std::runtime_error(
            "CPMM_* defaults must be positive and CPMM_FEE_PERCENT must be in [0, 100)");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be in 1..65535");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Defaults: L={}, P0={}, P1={}, fee={}%",
                 initial_liquidity, initial_price, final_price, fee_percent);
    spdlog::info("  Slider: center={}, decades={}", center_price, decades);
}
