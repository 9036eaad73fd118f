#include "notification_gate.hpp"
#include <spdlog/spdlog.h>

NotificationGate::NotificationGate(std::chrono::milliseconds stale_threshold, Clock clock,
                                   std::chrono::milliseconds max_future_skew)
    : stale_threshold_(stale_threshold), max_future_skew_(max_future_skew), clock_(std::move(clock)) {}

bool NotificationGate::should_deliver(const std::string& steam_id, const LogResult& result) {
    auto age = clock_() - result.occurred_at;
    if (age > stale_threshold_) {
        spdlog::debug("Log {} for player {} is stale ({}s old)", result.id, steam_id,
                      std::chrono::duration_cast<std::chrono::seconds>(age).count());
        return false;
    }

    if (-age > max_future_skew_) {
        spdlog::warn("Log {} for player {} is dated {}s in the future, ignoring", result.id, steam_id,
                     std::chrono::duration_cast<std::chrono::seconds>(-age).count());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& last = last_delivered_[steam_id];
    if (result.occurred_at <= last) {
        spdlog::debug("Log {} for player {} already announced", result.id, steam_id);
        return false;
    }

    last = result.occurred_at;
    return true;
}
