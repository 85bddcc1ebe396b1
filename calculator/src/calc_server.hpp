#pragma once

#include "config.hpp"
#include "session.hpp"
#include "health.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

// HTTP adapter over one CalculatorSession. httplib runs handlers on a worker
// pool, so every session access goes through session_mutex_.
class CalcServer {
public:
    CalcServer(const Config& config,
               CalculatorSession& session,
               HealthCheck& health);
    ~CalcServer();
    
    // Binds synchronously, so the port accepts connections once start()
    // returns. LISTEN_PORT 0 picks an ephemeral port. Throws std::runtime_error
    // when the address cannot be bound.
    void start();
    void stop();
    bool is_running() const { return running_; }
    int port() const { return bound_port_; }
    
private:
    const Config& config_;
    CalculatorSession& session_;
    HealthCheck& health_;
    
    std::mutex session_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    int bound_port_ = -1;
    std::thread server_thread_;
    
    void setup_routes();
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_get_session(const httplib::Request& req, httplib::Response& res);
    void handle_edit(const httplib::Request& req, httplib::Response& res);
    void handle_reset(const httplib::Request& req, httplib::Response& res);
    void handle_recompute(const httplib::Request& req, httplib::Response& res);
    
    // Caller holds session_mutex_
    nlohmann::json session_view();
    
    static void send_json(httplib::Response& res, int status, const nlohmann::json& body);
    static void send_error(httplib::Response& res, int status, const std::string& message);
};
