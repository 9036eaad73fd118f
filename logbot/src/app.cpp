#include "app.hpp"
#include "deliverer.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "health_server.hpp"
#include "irc_session.hpp"
#include "logs_client.hpp"
#include "notification_gate.hpp"
#include "polling_supervisor.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace {

// For graceful shutdown
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;
bool shutdown_requested = false;

void signal_handler(int signum) {
    spdlog::warn("Signal {} received, initiating graceful shutdown.", signum);
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex);
        shutdown_requested = true;
    }
    shutdown_cv.notify_one();
}

}

void install_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
}

void wait_for_shutdown_signal() {
    std::unique_lock<std::mutex> lock(shutdown_mutex);
    shutdown_cv.wait(lock, [] { return shutdown_requested; });
}

int run_bot(const Config& config, const std::function<void()>& wait_for_shutdown) {
    ChannelMap channels;
    try {
        config.validate();
        channels = load_channels(config.channels_file);
    } catch (const ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    }

    spdlog::info("Loaded {} players from {}", channels.size(), config.channels_file);

    try {
        LogsClient logs_client(config);
        NotificationGate gate(config.stale_threshold);
        Deliverer deliverer(config.spoiler_delay, config.logs_link_base);

        PollingSupervisor supervisor(config, channels, logs_client, gate, deliverer, [&config] {
            return std::make_unique<IrcSession>(config);
        });

        HealthChecker health_checker(supervisor);
        std::unique_ptr<HealthServer> health_server;
        if (config.health_enabled) {
            health_server = std::make_unique<HealthServer>(config, health_checker);
            health_server->start();
        }

        supervisor.start();
        wait_for_shutdown();

        supervisor.stop();
        if (health_server) {
            health_server->stop();
        }
    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("logbot has shut down. Exiting.");
    return 0;
}
