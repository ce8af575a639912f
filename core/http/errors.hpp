#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace agentlink {
namespace http {

/**
 * @brief API status codes mapped to HTTP status codes
 *
 * - OK -> HTTP 200
 * - ACCEPTED -> HTTP 202
 * - INVALID_ARGUMENT -> HTTP 400
 * - NOT_FOUND -> HTTP 404
 * - UNAVAILABLE -> HTTP 503
 * - INTERNAL -> HTTP 500
 */
enum class StatusCode { OK, ACCEPTED, INVALID_ARGUMENT, NOT_FOUND, UNAVAILABLE, INTERNAL };

inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::ACCEPTED:
            return 202;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::UNAVAILABLE:
            return 503;
        case StatusCode::INTERNAL:
            return 500;
        default:
            return 500;
    }
}

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::ACCEPTED:
            return "ACCEPTED";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::UNAVAILABLE:
            return "UNAVAILABLE";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

/**
 * @brief Build a JSON status object
 *
 * All HTTP responses include a top-level "status" object with code and message.
 */
inline nlohmann::json make_status(StatusCode code, const std::string &message = "") {
    std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
    return {{"code", status_code_to_string(code)}, {"message", msg}};
}

// Error response: just the status field
inline nlohmann::json make_error_response(StatusCode code, const std::string &message) {
    return {{"status", make_status(code, message)}};
}

}  // namespace http
}  // namespace agentlink
