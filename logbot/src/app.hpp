#pragma once
#include "config.hpp"
#include <functional>

// SIGINT/SIGTERM wake wait_for_shutdown_signal().
void install_signal_handlers();
void wait_for_shutdown_signal();

// Validates the config, loads the channel mapping and runs the bot until
// wait_for_shutdown returns. Returns the process exit code.
int run_bot(const Config& config, const std::function<void()>& wait_for_shutdown);
