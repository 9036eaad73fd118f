#include "deliverer.hpp"
#include "irc_protocol.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

Deliverer::Deliverer(std::chrono::milliseconds spoiler_delay, std::string link_base)
    : spoiler_delay_(spoiler_delay), link_base_(std::move(link_base)) {}

bool Deliverer::deliver(ChatSession& session, const std::string& channel, const LogResult& result,
                        const StopSignal& stop) const {
    if (stop.wait_for(spoiler_delay_)) {
        spdlog::info("Dropping log {} for #{}: session is shutting down", result.id, channel);
        return false;
    }

    session.send_line(format_message(channel, result));

    auto age = std::chrono::system_clock::now() - result.occurred_at;
    spdlog::info("Sent log id={} channel={} title=\"{}\" played={} ({}s ago)",
                 result.id, channel, result.title, util::format_iso8601(result.occurred_at),
                 std::chrono::duration_cast<std::chrono::seconds>(age).count());
    return true;
}

std::string Deliverer::format_message(const std::string& channel, const LogResult& result) const {
    return irc::privmsg(channel, link_base_ + std::to_string(result.id));
}
