#pragma once
#include <stdexcept>
#include <string>

// Fatal: bad or missing configuration, raised before the supervisor starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// The chat server could not be reached. The whole session is retried.
class ConnectError : public std::runtime_error {
public:
    explicit ConnectError(const std::string& what) : std::runtime_error(what) {}
};

// Transport, HTTP status or parse failure talking to the log service.
class QueryError : public std::runtime_error {
public:
    explicit QueryError(const std::string& what) : std::runtime_error(what) {}
};

// The log service answered but had nothing for this player.
class NoResultsError : public std::runtime_error {
public:
    NoResultsError(const std::string& what, std::string body)
        : std::runtime_error(what), body_(std::move(body)) {}

    const std::string& body() const { return body_; }

private:
    std::string body_;
};

// A line could not be written to the chat session.
class DeliveryError : public std::runtime_error {
public:
    explicit DeliveryError(const std::string& what) : std::runtime_error(what) {}
};
