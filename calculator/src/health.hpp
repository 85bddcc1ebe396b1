#pragma once

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

class HealthCheck {
public:
    explicit HealthCheck(const std::string& service_name);
    
    nlohmann::json get_status();
    bool is_healthy() const { return server_running_; }
    
    void set_server_running(bool running) { server_running_ = running; }
    void record_recompute();
    
private:
    std::string service_name_;
    int64_t started_ms_;
    std::atomic<int64_t> recomputes_{0};
    std::atomic<bool> server_running_{false};
    
    std::mutex mutex_;
    std::string last_recompute_ts_;
};
