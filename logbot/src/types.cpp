#include "types.hpp"
#include "errors.hpp"
#include <fmt/format.h>

LogResult LogResult::from_json(const nlohmann::json& j) {
    LogResult result;
    result.id = j.at("id").get<int64_t>();

    // system_clock ticks are finer than seconds; larger values overflow the conversion
    const int64_t date = j.at("date").get<int64_t>();
    const int64_t max_date = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::duration::max()).count();
    if (date < 0 || date > max_date) {
        throw QueryError(fmt::format("log {} has out of range date {}", result.id, date));
    }
    result.occurred_at = std::chrono::system_clock::time_point(std::chrono::seconds(date));

    result.title = j.value("title", "");
    return result;
}
