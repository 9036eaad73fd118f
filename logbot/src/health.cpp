#include "health.hpp"

HealthChecker::HealthChecker(const PollingSupervisor& supervisor) : supervisor_(supervisor) {}

HealthChecker::Status HealthChecker::check_health() const {
    Status status;
    status.supervisor = supervisor_.status();
    status.state = to_string(status.supervisor.state);
    status.ok = status.supervisor.connected;
    return status;
}

nlohmann::json HealthChecker::Status::to_json() const {
    return {
        {"ok", ok},
        {"state", state},
        {"connected", supervisor.connected},
        {"identities", supervisor.identities},
        {"active_loops", supervisor.active_loops},
        {"sessions_established", supervisor.sessions_established},
        {"deliveries_sent", supervisor.deliveries_sent},
        {"last_drain_acks", supervisor.last_drain_acks}
    };
}
