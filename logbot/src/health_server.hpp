#pragma once
#include "config.hpp"
#include "health.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

// Serves GET /health on its own thread.
class HealthServer {
public:
    HealthServer(const Config& config, const HealthChecker& checker);
    ~HealthServer();

    void start();
    void stop();
    bool is_running() const;

private:
    const Config& config_;
    const HealthChecker& checker_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;

    void setup_routes();
};
