#include "config.hpp"
#include "session.hpp"
#include "health.hpp"
#include "calc_server.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("Logging initialized at level: {}", log_level);
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.service_name, config.log_level);
        config.validate();
        
        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);
        
        CalculatorSession session(config.session_defaults());
        HealthCheck health(config.service_name);
        CalcServer server(config, session, health);
        
        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);
        
        server.start();
        
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            if (!server.is_running()) {
                spdlog::error("HTTP server exited unexpectedly");
                server.stop();
                return 1;
            }
        }
        
        spdlog::info("Shutting down gracefully");
        server.stop();
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
