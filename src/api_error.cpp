#include "api_error.h"

#include <nlohmann/json.hpp>

#include "util.h"

using json = nlohmann::ordered_json;

api_status_error::api_status_error(const std::string & message, int status_code, std::string request_id, std::string body):
    api_error(message, status_code == 408 || status_code == 429 || status_code >= 500),
    _status_code(status_code), _request_id(std::move(request_id)), _body(std::move(body)) {}

// OpenAI style servers answer with {"error": {"message": ...}}, FastAPI ones with {"detail": ...} and the
// Kokoro server with a flat {"message": ...}.
static std::string error_message_from_body(const std::string & body) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return strip(body, " \t\r\n");
    }
    if (data.contains("message") && data.at("message").is_string()) {
        return data.at("message").get<std::string>();
    }
    if (data.contains("error")) {
        const json & error = data.at("error");
        if (error.is_object() && error.contains("message") && error.at("message").is_string()) {
            return error.at("message").get<std::string>();
        }
        if (error.is_string()) {
            return error.get<std::string>();
        }
    }
    if (data.contains("detail")) {
        const json & detail = data.at("detail");
        if (detail.is_string()) {
            return detail.get<std::string>();
        }
        if (detail.is_object() && detail.contains("message") && detail.at("message").is_string()) {
            return detail.at("message").get<std::string>();
        }
    }
    return data.dump(-1, ' ', false, json::error_handler_t::replace);
}

api_status_error make_status_error(int status_code, const std::string & request_id, const std::string & body) {
    std::string message = error_message_from_body(body);
    if (message.empty()) {
        message = "HTTP " + std::to_string(status_code);
    }
    return api_status_error(message, status_code, request_id, body);
}
