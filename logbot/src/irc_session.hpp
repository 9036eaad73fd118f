#pragma once
#include "chat_session.hpp"
#include "config.hpp"
#include <boost/asio.hpp>
#include <deque>
#include <future>
#include <mutex>
#include <string>

// Plain-text IRC connection over TCP.
//
// All socket I/O after the handshake runs on io_context_, which is driven by
// the thread inside read_loop(). Other threads hand lines to send_line(), which
// queues them for the I/O thread and waits for the write to finish.
class IrcSession : public ChatSession {
public:
    explicit IrcSession(const Config& config);
    ~IrcSession() override;

    void connect() override;
    std::string read_loop() override;
    void send_line(const std::string& line) override;
    void abort(const std::string& reason) override;
    State state() const override;

private:
    struct PendingWrite {
        std::string data;
        std::promise<void> done;
    };

    std::future<void> enqueue(const std::string& line);
    void set_state(State state);

    // I/O thread only
    void start_read();
    void on_read(const boost::system::error_code& ec);
    void start_write();
    void on_write(const boost::system::error_code& ec);
    void close(const std::string& reason);

    const Config& config_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer read_deadline_;
    boost::asio::streambuf read_buffer_;

    mutable std::mutex mutex_;
    State state_ = State::Disconnected;
    std::deque<PendingWrite> write_queue_;
    bool writing_ = false;
    std::string close_reason_;
};
