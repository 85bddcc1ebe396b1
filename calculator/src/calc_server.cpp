#include "calc_server.hpp"
#include "json_schemas.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

CalcServer::CalcServer(const Config& config,
                       CalculatorSession& session,
                       HealthCheck& health)
    : config_(config)
    , session_(session)
    , health_(health)
    , server_(std::make_unique<httplib::Server>())
{}

CalcServer::~CalcServer() {
    stop();
}

void CalcServer::start() {
    if (running_) return;
    
    setup_routes();
    
    if (config_.listen_port == 0) {
        bound_port_ = server_->bind_to_any_port(config_.listen_addr);
    } else if (server_->bind_to_port(config_.listen_addr, config_.listen_port)) {
        bound_port_ = config_.listen_port;
    } else {
        bound_port_ = -1;
    }
    
    if (bound_port_ <= 0) {
        throw std::runtime_error(fmt::format("Failed to bind {}:{}",
                                             config_.listen_addr, config_.listen_port));
    }
    
    running_ = true;
    health_.set_server_running(true);
    
    server_thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            spdlog::error("HTTP server stopped accepting on {}:{}",
                          config_.listen_addr, bound_port_);
        }
        running_ = false;
        health_.set_server_running(false);
    });
    
    // httplib::Server::stop() is a no-op until the accept loop is entered
    while (running_ && !server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    
    spdlog::info("Calculator server listening on {}:{}", config_.listen_addr, bound_port_);
}

void CalcServer::stop() {
    if (!running_ && !server_thread_.joinable()) return;
    
    bool was_running = running_.exchange(false);
    server_->stop();
    
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    health_.set_server_running(false);
    
    if (was_running) {
        spdlog::info("Calculator server stopped");
    }
}

void CalcServer::setup_routes() {
    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
    
    server_->Get("/session",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_get_session(req, res);
        });
    
    server_->Post("/session/edit",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_edit(req, res);
        });
    
    server_->Post("/session/reset",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_reset(req, res);
        });
    
    server_->Post("/recompute",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_recompute(req, res);
        });
}

void CalcServer::send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void CalcServer::send_error(httplib::Response& res, int status, const std::string& message) {
    send_json(res, status, {
        {"ok", false},
        {"error", message},
        {"ts", util::current_iso8601()}
    });
}

nlohmann::json CalcServer::session_view() {
    auto output = session_.recompute();
    health_.record_recompute();
    
    return {
        {"session", session_to_json(session_)},
        {"output", recompute_to_json(output)}
    };
}

void CalcServer::handle_health(const httplib::Request&, httplib::Response& res) {
    auto status = health_.get_status();
    send_json(res, health_.is_healthy() ? 200 : 503, status);
}

void CalcServer::handle_get_session(const httplib::Request&, httplib::Response& res) {
    try {
        std::lock_guard<std::mutex> lock(session_mutex_);
        auto view = session_view();
        view["ok"] = true;
        send_json(res, 200, view);
    } catch (const std::exception& e) {
        spdlog::error("Failed to render session: {}", e.what());
        send_error(res, 500, "internal error");
    }
}

void CalcServer::handle_edit(const httplib::Request& req, httplib::Response& res) {
    SessionEdit edit;
    try {
        edit = SessionEdit::from_json(nlohmann::json::parse(req.body));
    } catch (const std::exception& e) {
        spdlog::warn("Malformed edit request: {}", e.what());
        send_error(res, 400, "expected {\"field\": ..., \"value\": ...}");
        return;
    }
    
    SessionField field = parse_session_field(edit.field);
    if (field == SessionField::Unknown) {
        spdlog::warn("Edit of unknown field '{}'", edit.field);
        send_error(res, 400, "unknown field: " + edit.field);
        return;
    }
    
    try {
        std::lock_guard<std::mutex> lock(session_mutex_);
        bool applied = session_.apply(field, edit.value);
        
        auto view = session_view();
        view["ok"] = applied;
        if (!applied) {
            view["error"] = "rejected " + edit.field + "=" + edit.value;
        }
        send_json(res, applied ? 200 : 422, view);
        
        spdlog::debug("Edit {}={} {}", edit.field, edit.value,
                      applied ? "applied" : "rejected");
    } catch (const std::exception& e) {
        spdlog::error("Failed to apply edit: {}", e.what());
        send_error(res, 500, "internal error");
    }
}

void CalcServer::handle_reset(const httplib::Request&, httplib::Response& res) {
    try {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_.reset(config_.session_defaults());
        auto view = session_view();
        view["ok"] = true;
        send_json(res, 200, view);
        spdlog::info("Session reset to defaults");
    } catch (const std::exception& e) {
        spdlog::error("Failed to reset session: {}", e.what());
        send_error(res, 500, "internal error");
    }
}

void CalcServer::handle_recompute(const httplib::Request& req, httplib::Response& res) {
    SessionState state;
    try {
        auto body = req.body.empty() ? nlohmann::json::object()
                                     : nlohmann::json::parse(req.body);
        state = session_state_from_json(body, config_.session_defaults());
    } catch (const std::exception& e) {
        spdlog::warn("Malformed recompute request: {}", e.what());
        send_error(res, 400, "expected a session object");
        return;
    }
    
    if (!state.is_valid()) {
        send_error(res, 400,
                   "liquidity, prices and decades must be positive; fee_percent in [0, 100)");
        return;
    }
    
    try {
        auto output = recompute(state);
        health_.record_recompute();
        send_json(res, 200, {
            {"ok", true},
            {"output", recompute_to_json(output)}
        });
    } catch (const std::invalid_argument& e) {
        send_error(res, 400, e.what());
    }
}
