#include "health_server.hpp"
#include <spdlog/spdlog.h>

HealthServer::HealthServer(const Config& config, const HealthChecker& checker)
    : config_(config), checker_(checker), running_(false) {
    server_ = std::make_unique<httplib::Server>();
    setup_routes();
}

HealthServer::~HealthServer() {
    stop();
}

void HealthServer::start() {
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting health server on {}:{}", config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("Health server failed to listen on {}:{}", config_.listen_addr, config_.listen_port);
        }
        running_ = false;
    });
}

void HealthServer::stop() {
    server_->stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    running_ = false;
}

bool HealthServer::is_running() const {
    return running_;
}

void HealthServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto status = checker_.check_health();
        res.status = status.ok ? 200 : 503;
        res.set_content(status.to_json().dump(), "application/json");
    });
}
