#pragma once
#include <string>

// Line builders for the subset of IRC the bot speaks. No CRLF is appended.
namespace irc {
    std::string pass(const std::string& credential);
    std::string nick(const std::string& username);
    std::string join(const std::string& channel);
    std::string privmsg(const std::string& channel, const std::string& text);
    std::string pong(const std::string& server_name);

    bool is_ping(const std::string& line);
}
