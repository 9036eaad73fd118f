#pragma once
#include "types.hpp"
#include <chrono>
#include <string>

struct Config {
    // Twitch credentials
    std::string username;
    std::string oauth_key;

    // Chat server
    std::string irc_host = "irc.chat.twitch.tv";
    int irc_port = 6667;
    std::string irc_server_name = "tmi.twitch.tv";

    // Log service
    std::string logs_api_url = "http://logs.tf";
    std::string logs_link_base = "http://logs.tf/";
    std::string channels_file = "channels.json";

    // Timing
    std::chrono::milliseconds poll_interval{std::chrono::seconds(10)};
    std::chrono::milliseconds spoiler_delay{std::chrono::seconds(15)};
    std::chrono::milliseconds stale_threshold{std::chrono::seconds(60)};
    std::chrono::milliseconds reconnect_backoff{std::chrono::seconds(30)};
    std::chrono::milliseconds read_timeout{std::chrono::minutes(10)};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds http_timeout{std::chrono::seconds(10)};

    // Health endpoint
    bool health_enabled = true;
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8080;

    // General
    std::string service_name = "logbot";
    std::string log_level = "info";

    static Config from_env();
    void validate() const;
};

// Reads the Steam ID -> channel mapping. Throws ConfigError.
ChannelMap load_channels(const std::string& path);
