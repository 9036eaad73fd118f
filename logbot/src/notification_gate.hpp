#pragma once
#include "types.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

// Decides whether a freshly fetched log should be announced.
//
// A log is announced when it is no older than the stale threshold and strictly
// newer than the last log announced for the same player. The check and the
// update of the last announced timestamp happen under one lock, so concurrent
// polls for the same player can never both be admitted. Logs dated further
// ahead than max_future_skew are rejected so a bogus date cannot become the
// player's high-water mark.
class NotificationGate {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit NotificationGate(std::chrono::milliseconds stale_threshold,
                              Clock clock = [] { return std::chrono::system_clock::now(); },
                              std::chrono::milliseconds max_future_skew = std::chrono::minutes(5));

    bool should_deliver(const std::string& steam_id, const LogResult& result);

private:
    const std::chrono::milliseconds stale_threshold_;
    const std::chrono::milliseconds max_future_skew_;
    Clock clock_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::system_clock::time_point> last_delivered_;
};
