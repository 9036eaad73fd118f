#include "irc_session.hpp"
#include "errors.hpp"
#include "irc_protocol.hpp"
#include <spdlog/spdlog.h>
#include <istream>
#include <memory>

namespace {
constexpr std::size_t kMaxLineBytes = 64 * 1024;
}

IrcSession::IrcSession(const Config& config)
    : config_(config),
      resolver_(io_context_),
      socket_(io_context_),
      read_deadline_(io_context_),
      read_buffer_(kMaxLineBytes) {}

IrcSession::~IrcSession() {
    boost::system::error_code ec;
    socket_.close(ec);
}

void IrcSession::connect() {
    set_state(State::Connecting);

    const std::string target = config_.irc_host + ":" + std::to_string(config_.irc_port);

    // Handlers may outlive this call if the deadline fires, so the outcome is shared.
    auto outcome = std::make_shared<boost::system::error_code>(boost::asio::error::would_block);
    resolver_.async_resolve(config_.irc_host, std::to_string(config_.irc_port),
        [this, outcome](const boost::system::error_code& ec,
                        const boost::asio::ip::tcp::resolver::results_type& endpoints) {
            if (ec) {
                *outcome = ec;
                return;
            }
            boost::asio::async_connect(socket_, endpoints,
                [outcome](const boost::system::error_code& connect_ec, const boost::asio::ip::tcp::endpoint&) {
                    *outcome = connect_ec;
                });
        });

    io_context_.restart();
    io_context_.run_for(config_.connect_timeout);

    if (state() == State::Closed) {
        std::lock_guard<std::mutex> lock(mutex_);
        throw ConnectError("connect to " + target + " aborted: " + close_reason_);
    }

    if (*outcome == boost::asio::error::would_block) {
        close("connect timed out");
        throw ConnectError("connect to " + target + " timed out");
    }

    if (*outcome) {
        set_state(State::Closed);
        throw ConnectError("connect to " + target + " failed: " + outcome->message());
    }

    set_state(State::Handshaking);

    boost::system::error_code ec;
    // The server does not acknowledge these; a bad credential only shows up
    // later as a dropped connection.
    for (const auto& line : {irc::pass(config_.oauth_key), irc::nick(config_.username)}) {
        boost::asio::write(socket_, boost::asio::buffer(line + "\r\n"), ec);
        if (ec) {
            set_state(State::Closed);
            throw ConnectError("handshake failed: " + ec.message());
        }
    }

    spdlog::info("Connected to {} as {}", target, config_.username);
    set_state(State::Live);
}

std::string IrcSession::read_loop() {
    if (state() != State::Live) {
        return "session is not live";
    }

    start_read();
    try {
        io_context_.restart();
        io_context_.run();
    } catch (const std::exception& e) {
        // The I/O thread is gone; fail queued writers instead of leaving them waiting.
        close(std::string("I/O error: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

void IrcSession::send_line(const std::string& line) {
    enqueue(line).get();
    spdlog::trace(">> {}", line);
}

void IrcSession::abort(const std::string& reason) {
    boost::asio::post(io_context_, [this, reason] { close(reason); });
}

ChatSession::State IrcSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::future<void> IrcSession::enqueue(const std::string& line) {
    std::future<void> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Live) {
            throw DeliveryError(std::string("chat session is ") + to_string(state_));
        }
        write_queue_.push_back(PendingWrite{line + "\r\n", std::promise<void>()});
        done = write_queue_.back().done.get_future();
    }
    boost::asio::post(io_context_, [this] { start_write(); });
    return done;
}

void IrcSession::set_state(State state) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("Chat session {} -> {}", to_string(state_), to_string(state));
    state_ = state;
}

void IrcSession::start_read() {
    read_deadline_.expires_after(config_.read_timeout);
    read_deadline_.async_wait([this](const boost::system::error_code& ec) {
        if (ec != boost::asio::error::operation_aborted) {
            close("no data received within read timeout");
        }
    });

    boost::asio::async_read_until(socket_, read_buffer_, "\r\n",
        [this](const boost::system::error_code& ec, std::size_t) { on_read(ec); });
}

void IrcSession::on_read(const boost::system::error_code& ec) {
    if (ec) {
        if (ec == boost::asio::error::eof) {
            close("connection closed by server");
        } else {
            close("read failed: " + ec.message());
        }
        return;
    }

    std::istream input(&read_buffer_);
    std::string line;
    std::getline(input, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (irc::is_ping(line)) {
        spdlog::debug("Answering keep-alive: {}", line);
        try {
            // Completion is not awaited on the I/O thread; a failed write closes the session.
            enqueue(irc::pong(config_.irc_server_name));
        } catch (const DeliveryError& e) {
            spdlog::warn("Could not answer keep-alive: {}", e.what());
        }
    } else {
        spdlog::trace("<< {}", line);
    }

    if (state() == State::Live) {
        start_read();
    }
}

void IrcSession::start_write() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (writing_ || write_queue_.empty() || state_ != State::Live) {
        return;
    }

    writing_ = true;
    boost::asio::async_write(socket_, boost::asio::buffer(write_queue_.front().data),
        [this](const boost::system::error_code& ec, std::size_t) { on_write(ec); });
}

void IrcSession::on_write(const boost::system::error_code& ec) {
    if (ec) {
        if (ec != boost::asio::error::operation_aborted) {
            close("write failed: " + ec.message());
        }
        return;
    }

    PendingWrite written;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Live || write_queue_.empty()) {
            return;
        }
        written = std::move(write_queue_.front());
        write_queue_.pop_front();
        writing_ = false;
    }
    written.done.set_value();

    start_write();
}

void IrcSession::close(const std::string& reason) {
    std::deque<PendingWrite> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Closed) {
            return;
        }
        state_ = State::Closed;
        close_reason_ = reason;
        writing_ = false;
        abandoned.swap(write_queue_);
    }

    spdlog::warn("Chat session closed: {}", reason);

    resolver_.cancel();
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        spdlog::debug("Socket close reported: {}", ec.message());
    }
    read_deadline_.cancel();

    for (auto& pending : abandoned) {
        pending.done.set_exception(std::make_exception_ptr(DeliveryError("chat session closed: " + reason)));
    }

    io_context_.stop();
}
