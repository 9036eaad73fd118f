#include "polling_supervisor.hpp"
#include "errors.hpp"
#include "irc_protocol.hpp"
#include <spdlog/spdlog.h>
#include <vector>

PollingSupervisor::PollingSupervisor(const Config& config,
                                     const ChannelMap& channels,
                                     LogFetcher& fetcher,
                                     NotificationGate& gate,
                                     const Deliverer& deliverer,
                                     SessionFactory session_factory)
    : config_(config),
      channels_(channels),
      fetcher_(fetcher),
      gate_(gate),
      deliverer_(deliverer),
      session_factory_(std::move(session_factory)) {}

PollingSupervisor::~PollingSupervisor() {
    stop();
}

void PollingSupervisor::start() {
    if (running_.exchange(true)) {
        return;
    }
    supervisor_thread_ = std::thread(&PollingSupervisor::run, this);
}

void PollingSupervisor::stop() {
    shutdown_.request();
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (live_session_) {
            live_session_->abort("shutting down");
        }
    }
    if (supervisor_thread_.joinable()) {
        supervisor_thread_.join();
    }
}

bool PollingSupervisor::is_running() const {
    return running_;
}

void PollingSupervisor::run() {
    running_ = true;
    spdlog::info("Supervisor started for {} players", channels_.size());

    while (!shutdown_.requested()) {
        try {
            run_session();
        } catch (const std::exception& e) {
            spdlog::error("Session cycle failed: {}", e.what());
            set_state(State::Idle);
        }

        if (shutdown_.requested()) {
            break;
        }

        spdlog::info("Reconnecting to chat server in {} ms", config_.reconnect_backoff.count());
        if (shutdown_.wait_for(config_.reconnect_backoff)) {
            break;
        }
    }

    set_state(State::Idle);
    running_ = false;
    spdlog::info("Supervisor stopped");
}

bool PollingSupervisor::run_session() {
    set_state(State::Connecting);

    std::unique_ptr<ChatSession> session = session_factory_();

    // Registered before connecting so stop() can cut a slow connect short.
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (shutdown_.requested()) {
            set_state(State::Idle);
            return false;
        }
        live_session_ = session.get();
    }

    try {
        session->connect();
    } catch (const ConnectError& e) {
        spdlog::error("Failed to connect to chat server: {}", e.what());
        clear_live_session();
        set_state(State::Idle);
        return false;
    } catch (const std::exception&) {
        clear_live_session();
        throw;
    }

    sessions_established_++;
    set_state(State::Running);

    StopSignal loops_stop;
    std::atomic<int> acks{0};
    std::vector<std::thread> loops;
    loops.reserve(channels_.size());

    for (const auto& [steam_id, channel] : channels_) {
        active_loops_++;
        loops.emplace_back([this, &steam_id = steam_id, &channel = channel, &session, &loops_stop, &acks] {
            identity_loop(steam_id, channel, *session, loops_stop);
            acks++;
            active_loops_--;
        });
    }

    std::string reason;
    try {
        reason = session->read_loop();
    } catch (const std::exception& e) {
        reason = e.what();
    }

    spdlog::warn("Lost connection to chat server ({}), stopping {} player loops", reason, loops.size());
    set_state(State::Draining);
    loops_stop.request();

    for (auto& loop : loops) {
        loop.join();
    }
    last_drain_acks_ = acks.load();
    spdlog::info("{} of {} player loops acknowledged shutdown", acks.load(), loops.size());

    clear_live_session();
    session.reset();
    set_state(State::Idle);
    return true;
}

PollingSupervisor::Status PollingSupervisor::status() const {
    Status status;
    status.state = state_.load();
    status.connected = status.state == State::Running;
    status.identities = channels_.size();
    status.active_loops = active_loops_.load();
    status.sessions_established = sessions_established_.load();
    status.deliveries_sent = deliveries_sent_.load();
    status.last_drain_acks = last_drain_acks_.load();
    return status;
}

void PollingSupervisor::identity_loop(const std::string& steam_id, const std::string& channel,
                                      ChatSession& session, const StopSignal& stop) {
    try {
        session.send_line(irc::join(channel));
        spdlog::info("Joined #{} for player {}", channel, steam_id);
    } catch (const DeliveryError& e) {
        spdlog::error("Failed to join #{} for player {}: {}", channel, steam_id, e.what());
        session.abort("join failed for #" + channel);
        return;
    }

    while (!stop.wait_for(config_.poll_interval)) {
        LogResult result;
        try {
            result = fetcher_.fetch_latest(steam_id);
        } catch (const NoResultsError& e) {
            spdlog::debug("No logs for player {} (#{}): {}", steam_id, channel, e.what());
            continue;
        } catch (const QueryError& e) {
            spdlog::warn("Failed to get log for player {} (#{}): {}", steam_id, channel, e.what());
            continue;
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error querying player {} (#{}): {}", steam_id, channel, e.what());
            continue;
        }

        if (!gate_.should_deliver(steam_id, result)) {
            continue;
        }

        try {
            if (!deliverer_.deliver(session, channel, result, stop)) {
                break;
            }
            deliveries_sent_++;
        } catch (const DeliveryError& e) {
            spdlog::error("Failed to send log {} to #{} for player {}: {}", result.id, channel, steam_id, e.what());
            session.abort("delivery failed in #" + channel);
            break;
        }
    }

    spdlog::info("Shutting down loop for player {} in #{}", steam_id, channel);
}

void PollingSupervisor::clear_live_session() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    live_session_ = nullptr;
}

void PollingSupervisor::set_state(State state) {
    State previous = state_.exchange(state);
    if (previous != state) {
        spdlog::debug("Supervisor {} -> {}", to_string(previous), to_string(state));
    }
}

const char* to_string(PollingSupervisor::State state) {
    switch (state) {
        case PollingSupervisor::State::Idle: return "idle";
        case PollingSupervisor::State::Connecting: return "connecting";
        case PollingSupervisor::State::Running: return "running";
        case PollingSupervisor::State::Draining: return "draining";
    }
    return "unknown";
}
