#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

// Steam ID -> Twitch channel (without the leading '#')
using ChannelMap = std::map<std::string, std::string>;

// Most recent match for one player, as returned by the log search endpoint
struct LogResult {
    int64_t id = 0;
    std::chrono::system_clock::time_point occurred_at;
    std::string title;

    static LogResult from_json(const nlohmann::json& j);
};
