#pragma once
#include "polling_supervisor.hpp"
#include <string>
#include <nlohmann/json.hpp>

class HealthChecker {
public:
    explicit HealthChecker(const PollingSupervisor& supervisor);

    struct Status {
        bool ok;
        std::string state;
        PollingSupervisor::Status supervisor;

        nlohmann::json to_json() const;
    };

    Status check_health() const;

private:
    const PollingSupervisor& supervisor_;
};
