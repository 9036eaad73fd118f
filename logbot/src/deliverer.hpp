#pragma once
#include "chat_session.hpp"
#include "stop_signal.hpp"
#include "types.hpp"
#include <chrono>
#include <string>

// Announces an admitted log in its channel after the spoiler delay.
class Deliverer {
public:
    Deliverer(std::chrono::milliseconds spoiler_delay, std::string link_base);

    // Returns false if `stop` fired during the delay; nothing is written then.
    // Throws DeliveryError when the line cannot be written.
    bool deliver(ChatSession& session, const std::string& channel, const LogResult& result,
                 const StopSignal& stop) const;

    std::string format_message(const std::string& channel, const LogResult& result) const;

private:
    const std::chrono::milliseconds spoiler_delay_;
    const std::string link_base_;
};
