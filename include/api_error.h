#pragma once

#include <stdexcept>
#include <string>

// Errors raised to the caller that drives a synthesis stream. None of them are retried by the library.
class api_error : public std::runtime_error {
public:
    explicit api_error(const std::string & message, bool retryable = true)
        : std::runtime_error(message), _retryable(retryable) {}

    bool retryable() const { return _retryable; }

private:
    bool _retryable;
};

class api_connection_error : public api_error {
public:
    explicit api_connection_error(const std::string & message = "Connection error.", bool retryable = true)
        : api_error(message, retryable) {}
};

class api_timeout_error : public api_connection_error {
public:
    explicit api_timeout_error(const std::string & message = "Request timed out.", bool retryable = true)
        : api_connection_error(message, retryable) {}
};

class api_status_error : public api_error {
public:
    api_status_error(const std::string & message, int status_code, std::string request_id, std::string body);

    int status_code() const { return _status_code; }
    const std::string & request_id() const { return _request_id; }
    const std::string & body() const { return _body; }

private:
    int _status_code;
    std::string _request_id;
    std::string _body;
};

/// Builds the status error for a non 2xx response. The message is taken from the JSON error body
/// ("message", "error.message" or "detail"), then from the raw body, then from the status code.
api_status_error make_status_error(int status_code, const std::string & request_id, const std::string & body);
