#pragma once
#include <memory>
#include <string>
#include <functional>

// One connection to the chat network, from handshake until loss.
class ChatSession {
public:
    enum class State { Disconnected, Connecting, Handshaking, Live, Closed };

    virtual ~ChatSession() = default;

    // Opens the transport and sends the handshake. Throws ConnectError.
    virtual void connect() = 0;

    // Serves keep-alives until the connection fails; returns why it ended.
    virtual std::string read_loop() = 0;

    // Writes one line; safe from any thread. Throws DeliveryError.
    virtual void send_line(const std::string& line) = 0;

    // Makes read_loop() return as soon as possible.
    virtual void abort(const std::string& reason) = 0;

    virtual State state() const = 0;
};

using SessionFactory = std::function<std::unique_ptr<ChatSession>()>;

const char* to_string(ChatSession::State state);
