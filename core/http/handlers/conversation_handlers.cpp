#include <cstdlib>

#include "../../agent/agent_supervisor.hpp"
#include "../../conversation/conversation_store.hpp"
#include "../../conversation/request_coordinator.hpp"
#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace agentlink {
namespace http {

namespace {

nlohmann::json entry_to_json(const conversation::ConversationEntry &entry) {
    nlohmann::json j = {{"role", entry.role}, {"content", entry.content}, {"timestamp", entry.timestamp}};
    if (entry.role == "assistant" && !entry.tool_calls.empty()) {
        j["tool_calls"] = entry.tool_calls;
    }
    return j;
}

}  // namespace

//=============================================================================
// POST /v0/conversation/messages
//=============================================================================
void HttpServer::handle_post_message(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    if (!body.contains("content") || !body["content"].is_string()) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Missing 'content' string"));
        return;
    }

    auto request_id = coordinator_.handle_user_message(body["content"].get<std::string>());
    if (!request_id) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Empty message received"));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::ACCEPTED)}, {"request_id", *request_id}};
    send_json(res, StatusCode::ACCEPTED, response);
}

//=============================================================================
// POST /v0/conversation/interrupt
//=============================================================================
void HttpServer::handle_post_interrupt(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    std::string reason = "user_stopped";
    if (body.contains("reason") && body["reason"].is_string() && !body["reason"].get<std::string>().empty()) {
        reason = body["reason"].get<std::string>();
    }

    bool interrupted = coordinator_.handle_interrupt(reason);

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"interrupted", interrupted}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/conversation/inbound
//=============================================================================
void HttpServer::handle_post_inbound(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    // Malformed messages are reported to the client over the event stream as well
    bool accepted = coordinator_.handle_message(body);

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"accepted", accepted}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/conversation/history
//=============================================================================
void HttpServer::handle_get_history(const httplib::Request &req, httplib::Response &res) {
    size_t limit = 0;
    if (req.has_param("limit")) {
        const std::string raw = req.get_param_value("limit");
        char *end = nullptr;
        long parsed = std::strtol(raw.c_str(), &end, 10);
        if (raw.empty() || end == nullptr || *end != '\0' || parsed < 0) {
            send_json(res, StatusCode::INVALID_ARGUMENT,
                      make_error_response(StatusCode::INVALID_ARGUMENT, "limit must be a non-negative integer"));
            return;
        }
        limit = static_cast<size_t>(parsed);
    }

    nlohmann::json messages = nlohmann::json::array();
    for (const auto &entry : store_.recent(limit)) {
        messages.push_back(entry_to_json(entry));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"conversation", store_.summary()},
                               {"messages", messages}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/conversation/status
//=============================================================================
void HttpServer::handle_get_status(const httplib::Request & /*req*/, httplib::Response &res) {
    auto state = coordinator_.state();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_);

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)},
        {"state", state.processing ? "processing" : "idle"},
        {"current_request_id", state.current_request_id},
        {"uptime_seconds", uptime.count()},
        {"requests",
         {{"started", state.requests_started},
          {"completed", state.requests_completed},
          {"failed", state.requests_failed},
          {"interrupted", state.requests_interrupted},
          {"stale_messages_dropped", state.stale_messages_dropped}}},
        {"sse_clients", sse_client_count_.load()}};

    if (supervisor_ != nullptr) {
        auto snapshot = supervisor_->snapshot();
        response["agent"] = {{"running", snapshot.running},
                             {"pid", snapshot.pid},
                             {"spawn_count", snapshot.spawn_count},
                             {"kill_count", snapshot.kill_count},
                             {"needs_history_replay", snapshot.needs_history_replay}};
    }

    if (event_stream_) {
        response["events"] = {{"subscribers", event_stream_->subscriber_count()},
                              {"undelivered", event_stream_->undelivered_count()}};
    }

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace agentlink
