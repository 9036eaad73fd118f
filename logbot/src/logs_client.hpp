#pragma once
#include "config.hpp"
#include "types.hpp"
#include <string>

// Source of the latest log for a player. Throws QueryError or NoResultsError.
class LogFetcher {
public:
    virtual ~LogFetcher() = default;
    virtual LogResult fetch_latest(const std::string& steam_id) = 0;
};

class LogsClient : public LogFetcher {
public:
    explicit LogsClient(const Config& config);

    LogResult fetch_latest(const std::string& steam_id) override;

    // Parses a json_search response body into its first log.
    static LogResult parse_search_response(const std::string& body);

private:
    const Config& config_;
    std::string search_url_;
};
