#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"

namespace agentlink {
namespace http {

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

// Helper: Parse a JSON object body. An empty body yields {}. On failure sends a 400 and returns false.
inline bool parse_json_body(const httplib::Request &req, httplib::Response &res, nlohmann::json &out) {
    if (req.body.empty()) {
        out = nlohmann::json::object();
        return true;
    }
    out = nlohmann::json::parse(req.body, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Request body must be a JSON object"));
        return false;
    }
    return true;
}

}  // namespace http
}  // namespace agentlink
