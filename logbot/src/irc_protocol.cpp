#include "irc_protocol.hpp"
#include <fmt/format.h>

namespace irc {

std::string pass(const std::string& credential) {
    return fmt::format("PASS {}", credential);
}

std::string nick(const std::string& username) {
    return fmt::format("NICK {}", username);
}

std::string join(const std::string& channel) {
    return fmt::format("JOIN #{}", channel);
}

std::string privmsg(const std::string& channel, const std::string& text) {
    return fmt::format("PRIVMSG #{} :{}", channel, text);
}

std::string pong(const std::string& server_name) {
    return fmt::format("PONG :{}", server_name);
}

bool is_ping(const std::string& line) {
    return line.rfind("PING", 0) == 0;
}

}
