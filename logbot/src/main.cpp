#include "app.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

int main() {
    Config config;
    try {
        config = Config::from_env();
    } catch (const ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    }

    util::setup_logging(config.service_name, config.log_level);
    install_signal_handlers();
    return run_bot(config, wait_for_shutdown_signal);
}
