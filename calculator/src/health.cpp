#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(const std::string& service_name)
    : service_name_(service_name)
    , started_ms_(util::current_timestamp_ms())
{}

void HealthCheck::record_recompute() {
    recomputes_++;
    std::lock_guard<std::mutex> lock(mutex_);
    last_recompute_ts_ = util::current_iso8601();
}

nlohmann::json HealthCheck::get_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    nlohmann::json last_ts = nullptr;
    if (!last_recompute_ts_.empty()) {
        last_ts = last_recompute_ts_;
    }
    
    return {
        {"ok", is_healthy()},
        {"service", service_name_},
        {"server", server_running_ ? "up" : "down"},
        {"uptime_s", (util::current_timestamp_ms() - started_ms_) / 1000},
        {"recomputes", recomputes_.load()},
        {"last_recompute_ts", last_ts}
    };
}
