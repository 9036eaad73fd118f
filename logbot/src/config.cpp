#include "config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <cstring>
#include <charconv>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace {

std::string get_env(const char* name, const std::string& default_val) {
    const char* value = std::getenv(name);
    return value ? value : default_val;
}

int get_env_int(const char* name, int default_val) {
    const char* value = std::getenv(name);
    if (!value) {
        return default_val;
    }
    int int_val = 0;
    auto result = std::from_chars(value, value + std::strlen(value), int_val);
    if (result.ec != std::errc() || result.ptr != value + std::strlen(value)) {
        throw ConfigError(std::string(name) + " is not an integer: " + value);
    }
    return int_val;
}

std::chrono::milliseconds get_env_seconds(const char* name, std::chrono::milliseconds default_val) {
    auto default_seconds = std::chrono::duration_cast<std::chrono::seconds>(default_val);
    return std::chrono::seconds(get_env_int(name, static_cast<int>(default_seconds.count())));
}

bool get_env_bool(const char* name, bool default_val) {
    std::string value = get_env(name, default_val ? "true" : "false");
    return value == "true" || value == "1" || value == "yes";
}

// <VAR>_FILE wins over <VAR>; empty when neither is set
std::string read_secret(const std::string& file_env, const std::string& env) {
    const char* file_path = std::getenv(file_env.c_str());
    if (file_path) {
        std::ifstream file(file_path);
        if (!file.is_open()) {
            throw ConfigError(file_env + " points to an unreadable file: " + file_path);
        }
        std::string content;
        std::getline(file, content);
        if (!content.empty() && content.back() == '\r') {
            content.pop_back();
        }
        return content;
    }
    return get_env(env.c_str(), "");
}

}

Config Config::from_env() {
    Config config;

    config.username = read_secret("LOGS_BOT_USERNAME_FILE", "LOGS_BOT_USERNAME");
    config.oauth_key = read_secret("LOGS_BOT_OAUTH_KEY_FILE", "LOGS_BOT_OAUTH_KEY");

    config.irc_host = get_env("IRC_HOST", config.irc_host);
    config.irc_port = get_env_int("IRC_PORT", config.irc_port);
    config.irc_server_name = get_env("IRC_SERVER_NAME", config.irc_server_name);

    config.logs_api_url = get_env("LOGS_API_URL", config.logs_api_url);
    config.logs_link_base = get_env("LOGS_LINK_BASE", config.logs_link_base);
    config.channels_file = get_env("CHANNELS_FILE", config.channels_file);

    config.poll_interval = get_env_seconds("POLL_INTERVAL_SECONDS", config.poll_interval);
    config.spoiler_delay = get_env_seconds("SPOILER_DELAY_SECONDS", config.spoiler_delay);
    config.stale_threshold = get_env_seconds("STALE_THRESHOLD_SECONDS", config.stale_threshold);
    config.reconnect_backoff = get_env_seconds("RECONNECT_BACKOFF_SECONDS", config.reconnect_backoff);
    config.read_timeout = get_env_seconds("READ_TIMEOUT_SECONDS", config.read_timeout);
    config.connect_timeout = get_env_seconds("CONNECT_TIMEOUT_SECONDS", config.connect_timeout);
    config.http_timeout = get_env_seconds("HTTP_TIMEOUT_SECONDS", config.http_timeout);

    config.health_enabled = get_env_bool("HEALTH_ENABLED", config.health_enabled);
    config.listen_addr = get_env("LISTEN_ADDR", config.listen_addr);
    config.listen_port = get_env_int("LISTEN_PORT", config.listen_port);

    config.service_name = get_env("SERVICE_NAME", config.service_name);
    config.log_level = get_env("LOG_LEVEL", config.log_level);

    return config;
}

void Config::validate() const {
    if (username.empty() || oauth_key.empty()) {
        throw ConfigError("LOGS_BOT_USERNAME and LOGS_BOT_OAUTH_KEY must be set");
    }

    if (irc_host.empty() || irc_port <= 0 || irc_port > 65535) {
        throw ConfigError("Invalid chat server address");
    }

    if (logs_api_url.empty()) {
        throw ConfigError("LOGS_API_URL must not be empty");
    }

    if (poll_interval.count() <= 0 || stale_threshold.count() <= 0 ||
        reconnect_backoff.count() <= 0 || read_timeout.count() <= 0 ||
        connect_timeout.count() <= 0 ||
        http_timeout.count() <= 0 || spoiler_delay.count() < 0) {
        throw ConfigError("Timing settings must be positive");
    }

    if (health_enabled && (listen_port <= 0 || listen_port > 65535)) {
        throw ConfigError("Invalid health listen port");
    }
}

ChannelMap load_channels(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open channels file " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed channels file " + path + ": " + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError("Channels file " + path + " must contain a JSON object");
    }

    ChannelMap channels;
    for (const auto& item : j.items()) {
        const std::string& steam_id = item.key();
        const auto& channel = item.value();
        if (!channel.is_string()) {
            throw ConfigError("Channel for " + steam_id + " must be a string");
        }
        std::string name = channel.get<std::string>();
        if (!name.empty() && name.front() == '#') {
            name.erase(0, 1);
        }
        if (steam_id.empty() || name.empty()) {
            throw ConfigError("Empty player or channel entry in " + path);
        }
        channels[steam_id] = name;
    }

    if (channels.empty()) {
        throw ConfigError("Channels file " + path + " has no entries");
    }

    return channels;
}
