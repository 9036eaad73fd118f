#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// One-shot cancellation flag with interruptible waits.
class StopSignal {
public:
    void request();
    bool requested() const;

    // Sleeps for up to `duration`. Returns true if a stop was requested.
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return requested_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool requested_ = false;
};
