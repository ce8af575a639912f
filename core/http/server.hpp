#pragma once

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "events/event_stream.hpp"
#include "runtime/config.hpp"

namespace agentlink {
namespace agent {
class AgentSupervisor;
}
namespace conversation {
class ConversationStore;
class RequestCoordinator;
}  // namespace conversation

namespace http {

/**
 * @brief HTTP adapter for one conversation
 *
 * The server exposes the request coordinator over REST plus an SSE stream of outbound
 * messages. It runs in its own thread; handlers execute in httplib's thread pool and
 * delegate to the coordinator, which serializes inbound handling itself.
 *
 * Endpoints (v0):
 * - POST /v0/conversation/messages   {"content": "..."} -> 202 + request_id
 * - POST /v0/conversation/interrupt  {"reason": "..."}
 * - POST /v0/conversation/inbound    typed message ({"type": "user_message" | "interrupt", ...})
 * - GET  /v0/conversation/history    ?limit=N
 * - GET  /v0/conversation/status
 * - GET  /v0/events                  SSE, ?types=tool_use,text_block
 *
 * All JSON responses include a top-level "status" object.
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, conversation::RequestCoordinator &coordinator,
               conversation::ConversationStore &store, std::shared_ptr<events::EventStream> event_stream,
               agent::AgentSupervisor *supervisor = nullptr);

    ~HttpServer();

    /**
     * @brief Bind to the configured address/port and start the server thread
     *
     * @param error Populated with error message on failure
     */
    bool start(std::string &error);

    /**
     * @brief Stop the server and join its thread. Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    conversation::RequestCoordinator &coordinator_;
    conversation::ConversationStore &store_;
    std::shared_ptr<events::EventStream> event_stream_;
    agent::AgentSupervisor *supervisor_;

    std::chrono::steady_clock::time_point started_at_;

    std::atomic<int> sse_client_count_{0};

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();
    void install_cors();
    void install_error_handlers();
    bool bind(std::string &error);

    // handlers/conversation_handlers.cpp
    void handle_post_message(const httplib::Request &req, httplib::Response &res);
    void handle_post_interrupt(const httplib::Request &req, httplib::Response &res);
    void handle_post_inbound(const httplib::Request &req, httplib::Response &res);
    void handle_get_history(const httplib::Request &req, httplib::Response &res);
    void handle_get_status(const httplib::Request &req, httplib::Response &res);

    // handlers/event_handlers.cpp
    void handle_get_events(const httplib::Request &req, httplib::Response &res);
};

// SSE framing: "event: <type>\nid: <id>\ndata: <json>\n\n"
std::string format_sse_event(const events::OutboundEvent &event);

// Value for Access-Control-Allow-Origin, or nullopt when `origin` is not allowed.
// Entries may be "*" or contain one '*' wildcard ("http://localhost:*").
std::optional<std::string> match_cors_origin(const std::vector<std::string> &allowed, const std::string &origin);

}  // namespace http
}  // namespace agentlink
