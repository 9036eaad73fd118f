#pragma once
#include "chat_session.hpp"
#include "config.hpp"
#include "deliverer.hpp"
#include "logs_client.hpp"
#include "notification_gate.hpp"
#include "stop_signal.hpp"
#include "types.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

// Keeps one chat session alive and runs a polling loop per tracked player
// while it is.
//
// Each session goes Idle -> Connecting -> Running -> Draining -> Idle. Player
// loops only exist in Running; on connection loss every loop is told to stop
// and joined before the session is dropped and a reconnect is scheduled.
class PollingSupervisor {
public:
    enum class State { Idle, Connecting, Running, Draining };

    struct Status {
        State state = State::Idle;
        bool connected = false;
        std::size_t identities = 0;
        int active_loops = 0;
        uint64_t sessions_established = 0;
        uint64_t deliveries_sent = 0;
        int last_drain_acks = 0;
    };

    PollingSupervisor(const Config& config,
                      const ChannelMap& channels,
                      LogFetcher& fetcher,
                      NotificationGate& gate,
                      const Deliverer& deliverer,
                      SessionFactory session_factory);
    ~PollingSupervisor();

    void start();
    void stop();
    bool is_running() const;

    // Blocks, reconnecting forever, until stop() is called.
    void run();

    // One connect/run/drain pass. Returns false if no session was established.
    bool run_session();

    Status status() const;

private:
    void identity_loop(const std::string& steam_id, const std::string& channel,
                       ChatSession& session, const StopSignal& stop);
    void clear_live_session();
    void set_state(State state);

    const Config& config_;
    const ChannelMap& channels_;
    LogFetcher& fetcher_;
    NotificationGate& gate_;
    const Deliverer& deliverer_;
    SessionFactory session_factory_;

    StopSignal shutdown_;
    std::thread supervisor_thread_;
    std::atomic<bool> running_{false};

    std::mutex session_mutex_;
    ChatSession* live_session_ = nullptr;

    std::atomic<State> state_{State::Idle};
    std::atomic<int> active_loops_{0};
    std::atomic<uint64_t> sessions_established_{0};
    std::atomic<uint64_t> deliveries_sent_{0};
    std::atomic<int> last_drain_acks_{0};
};

const char* to_string(PollingSupervisor::State state);
