#pragma once

#include "session.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // Session defaults
    double initial_liquidity;
    double initial_price;
    double final_price;
    double fee_percent;
    
    // Slider calibration
    double center_price;
    double decades;
    
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
    SessionState session_defaults() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
