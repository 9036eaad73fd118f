#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <istream>
#include <string>
#include <thread>
#include <vector>

#include <utility>

#include <boost/asio.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "irc_session.hpp"

namespace {
using namespace std::chrono_literals;
using boost::asio::ip::tcp;

std::string read_line(tcp::socket& socket, boost::asio::streambuf& buffer) {
    boost::asio::read_until(socket, buffer, "\r\n");
    std::istream input(&buffer);
    std::string line;
    std::getline(input, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

void write_line(tcp::socket& socket, const std::string& line) {
    boost::asio::write(socket, boost::asio::buffer(line + "\r\n"));
}

// Loopback stand-in for the chat server; `script` runs once per accepted client.
class LoopbackServer {
public:
    explicit LoopbackServer(std::function<void(tcp::socket&)> script)
        : acceptor_(io_context_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        thread_ = std::thread([this, script = std::move(script)] {
            try {
                tcp::socket socket(io_context_);
                acceptor_.accept(socket);
                script(socket);
            } catch (const std::exception& e) {
                error_ = e.what();
            }
        });
    }

    ~LoopbackServer() { join(); }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return acceptor_.local_endpoint().port(); }
    const std::string& error() const { return error_; }

private:
    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread thread_;
    std::string error_;
};

Config make_config(int port) {
    Config config;
    config.irc_host = "127.0.0.1";
    config.irc_port = port;
    config.username = "logsbot";
    config.oauth_key = "oauth:secret";
    config.irc_server_name = "tmi.twitch.tv";
    config.read_timeout = 5s;
    return config;
}

}  // namespace

int main() {
    // Handshake, keep-alive answer and loss detection.
    {
        std::vector<std::string> received;
        LoopbackServer server([&received](tcp::socket& socket) {
            boost::asio::streambuf buffer;
            received.push_back(read_line(socket, buffer));
            received.push_back(read_line(socket, buffer));
            write_line(socket, ":tmi.twitch.tv 001 logsbot :Welcome, GLHF!");
            write_line(socket, "PING :tmi.twitch.tv");
            received.push_back(read_line(socket, buffer));
            socket.close();
        });

        Config config = make_config(server.port());
        IrcSession session(config);
        session.connect();
        if (session.state() != ChatSession::State::Live) {
            std::cerr << "Session should be live after connect\n";
            return 1;
        }

        const std::string reason = session.read_loop();
        server.join();

        if (!server.error().empty()) {
            std::cerr << "Server script failed: " << server.error() << "\n";
            return 1;
        }
        if (received.size() != 3 || received[0] != "PASS oauth:secret" || received[1] != "NICK logsbot" ||
            received[2] != "PONG :tmi.twitch.tv") {
            std::cerr << "Unexpected lines from the client\n";
            for (const auto& line : received) {
                std::cerr << "  " << line << "\n";
            }
            return 1;
        }
        if (reason.empty()) {
            std::cerr << "read_loop should describe why the connection ended\n";
            return 1;
        }
        if (session.state() != ChatSession::State::Closed) {
            std::cerr << "Session should be closed after read_loop returns\n";
            return 1;
        }

        try {
            session.send_line("PRIVMSG #alice :http://logs.tf/55");
            std::cerr << "Writes after loss must fail\n";
            return 1;
        } catch (const DeliveryError&) {
        }
    }

    // Lines written from other threads while the read loop runs.
    {
        std::string received;
        LoopbackServer server([&received](tcp::socket& socket) {
            boost::asio::streambuf buffer;
            read_line(socket, buffer);
            read_line(socket, buffer);
            received = read_line(socket, buffer);
            socket.close();
        });

        Config config = make_config(server.port());
        IrcSession session(config);
        session.connect();

        auto reader = std::async(std::launch::async, [&session] { return session.read_loop(); });
        try {
            session.send_line("PRIVMSG #alice :http://logs.tf/55");
        } catch (const DeliveryError& e) {
            std::cerr << "send_line failed on a live session: " << e.what() << "\n";
            return 1;
        }

        if (reader.wait_for(5s) != std::future_status::ready) {
            std::cerr << "read_loop did not notice the server closing\n";
            session.abort("test timeout");
            return 1;
        }
        server.join();

        if (received != "PRIVMSG #alice :http://logs.tf/55") {
            std::cerr << "Server received \"" << received << "\"\n";
            return 1;
        }
    }

    // abort() ends the read loop.
    {
        LoopbackServer server([](tcp::socket& socket) {
            boost::asio::streambuf buffer;
            boost::system::error_code ec;
            boost::asio::read(socket, buffer, boost::asio::transfer_all(), ec);
        });

        Config config = make_config(server.port());
        IrcSession session(config);
        session.connect();

        auto reader = std::async(std::launch::async, [&session] { return session.read_loop(); });
        std::this_thread::sleep_for(50ms);
        session.abort("shutting down");

        if (reader.wait_for(5s) != std::future_status::ready) {
            std::cerr << "abort did not end the read loop\n";
            return 1;
        }
        if (reader.get() != "shutting down") {
            std::cerr << "read_loop should report the abort reason\n";
            return 1;
        }
    }

    // Silence past the read timeout counts as loss.
    {
        LoopbackServer server([](tcp::socket& socket) {
            boost::asio::streambuf buffer;
            boost::system::error_code ec;
            boost::asio::read(socket, buffer, boost::asio::transfer_all(), ec);
        });

        Config config = make_config(server.port());
        config.read_timeout = 100ms;
        IrcSession session(config);
        session.connect();

        auto reader = std::async(std::launch::async, [&session] { return session.read_loop(); });
        if (reader.wait_for(5s) != std::future_status::ready) {
            std::cerr << "read timeout did not end the read loop\n";
            session.abort("test timeout");
            return 1;
        }
        if (reader.get().find("timeout") == std::string::npos) {
            std::cerr << "read_loop should report the timeout\n";
            return 1;
        }
    }

    // Nothing listening.
    {
        int port = 0;
        {
            boost::asio::io_context io_context;
            tcp::acceptor released(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
            port = released.local_endpoint().port();
        }

        Config config = make_config(port);
        IrcSession session(config);
        try {
            session.connect();
            std::cerr << "Expected ConnectError when nothing listens\n";
            return 1;
        } catch (const ConnectError&) {
        }
    }

    // A connect that never completes gives up at the deadline. Where the
    // address is unreachable outright the error simply arrives sooner.
    {
        Config config = make_config(6667);
        config.irc_host = "10.255.255.1";
        config.connect_timeout = 200ms;
        IrcSession session(config);

        const auto started = std::chrono::steady_clock::now();
        try {
            session.connect();
            std::cerr << "Expected ConnectError from an unreachable server\n";
            return 1;
        } catch (const ConnectError&) {
        }
        if (std::chrono::steady_clock::now() - started > 3s) {
            std::cerr << "connect ignored its deadline\n";
            return 1;
        }
        if (session.state() != ChatSession::State::Closed) {
            std::cerr << "Session should be closed after a failed connect\n";
            return 1;
        }
    }

    // abort() cuts a pending connect short.
    {
        Config config = make_config(6667);
        config.irc_host = "10.255.255.1";
        config.connect_timeout = 60s;
        IrcSession session(config);

        auto connecting = std::async(std::launch::async, [&session] {
            try {
                session.connect();
                return std::string("connected");
            } catch (const ConnectError& e) {
                return std::string(e.what());
            }
        });
        std::this_thread::sleep_for(100ms);
        session.abort("shutting down");

        if (connecting.wait_for(3s) != std::future_status::ready) {
            std::cerr << "abort did not end a pending connect\n";
            return 1;
        }
        if (connecting.get() == "connected") {
            std::cerr << "connect should fail once aborted\n";
            return 1;
        }
    }

    return 0;
}
