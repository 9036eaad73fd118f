#include "chat_session.hpp"

const char* to_string(ChatSession::State state) {
    switch (state) {
        case ChatSession::State::Disconnected: return "disconnected";
        case ChatSession::State::Connecting: return "connecting";
        case ChatSession::State::Handshaking: return "handshaking";
        case ChatSession::State::Live: return "live";
        case ChatSession::State::Closed: return "closed";
    }
    return "unknown";
}
