#include "logs_client.hpp"
#include "errors.hpp"
#include <cpr/cpr.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

LogsClient::LogsClient(const Config& config)
    : config_(config), search_url_(config.logs_api_url + "/json_search") {}

LogResult LogsClient::fetch_latest(const std::string& steam_id) {
    cpr::Response response = cpr::Get(
        cpr::Url{search_url_},
        cpr::Parameters{{"player", steam_id}, {"limit", "1"}},
        cpr::Timeout{config_.http_timeout}
    );

    if (response.error) {
        throw QueryError(fmt::format("request for player {} failed: {}", steam_id, response.error.message));
    }

    if (response.status_code != 200) {
        throw QueryError(fmt::format("request for player {} returned HTTP {}", steam_id, response.status_code));
    }

    spdlog::trace("json_search player={} body={}", steam_id, response.text);
    return parse_search_response(response.text);
}

LogResult LogsClient::parse_search_response(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);

        bool success = j.value("success", false);
        int results = j.value("results", 0);
        const auto logs = j.value("logs", nlohmann::json::array());

        if (!success || results <= 0 || !logs.is_array() || logs.empty()) {
            throw NoResultsError(fmt::format("query failed, success={} results={}", success, results), body);
        }

        return LogResult::from_json(logs.front());
    } catch (const nlohmann::json::exception& e) {
        throw QueryError(fmt::format("malformed search response: {}", e.what()));
    }
}
