#pragma once
#include <chrono>
#include <string>

namespace util {
    void setup_logging(const std::string& service_name, const std::string& level);
    std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
}
