#include "../../conversation/request_coordinator.hpp"
#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace agentlink {
namespace http {

namespace {
constexpr int kPopTimeoutMs = 1000;
constexpr int kKeepaliveEveryEmptyPops = 15;
}  // namespace

//=============================================================================
// GET /v0/events (SSE - Server-Sent Events)
//=============================================================================
void HttpServer::handle_get_events(const httplib::Request &req, httplib::Response &res) {
    if (!event_stream_) {
        send_json(res, StatusCode::UNAVAILABLE,
                  make_error_response(StatusCode::UNAVAILABLE, "Event streaming not enabled"));
        return;
    }

    int current_clients = sse_client_count_.load();
    if (current_clients >= config_.max_sse_clients) {
        LOG_WARN("[SSE] Client rejected: max clients (" << config_.max_sse_clients << ") reached");
        send_json(res, StatusCode::UNAVAILABLE, make_error_response(StatusCode::UNAVAILABLE, "Too many SSE clients"));
        return;
    }

    events::EventFilter filter = events::EventFilter::all();
    if (req.has_param("types")) {
        filter = events::EventFilter::from_list(req.get_param_value("types"));
    }

    std::string client_name = "sse-" + std::to_string(current_clients + 1);
    std::shared_ptr<events::Subscription> subscription(event_stream_->subscribe(filter, 0, client_name).release());

    if (!subscription) {
        LOG_ERROR("[SSE] Failed to create subscription");
        send_json(res, StatusCode::UNAVAILABLE,
                  make_error_response(StatusCode::UNAVAILABLE, "Failed to subscribe to events"));
        return;
    }

    sse_client_count_++;
    LOG_INFO("[SSE] Client connected: " << client_name);

    res.set_header("Content-Type", "text/event-stream");
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");  // Disable nginx buffering

    // The greeting goes to this client only, ahead of anything queued for it
    events::OutboundEvent greeting;
    greeting.type = "session_info";
    greeting.message = coordinator_.session_info();
    auto pending_greeting = std::make_shared<std::string>(format_sse_event(greeting));

    auto keepalive_counter = std::make_shared<int>(0);

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, subscription, client_name, keepalive_counter, pending_greeting](size_t /*offset*/,
                                                                               httplib::DataSink &sink) {
            if (!running_.load()) {
                return false;
            }

            if (!pending_greeting->empty()) {
                if (!sink.write(pending_greeting->c_str(), pending_greeting->size())) {
                    LOG_WARN("[SSE] Write failed for " << client_name);
                    return false;
                }
                pending_greeting->clear();
            }

            auto event_opt = subscription->pop(kPopTimeoutMs);

            if (event_opt) {
                std::string sse_data = format_sse_event(*event_opt);
                if (!sink.write(sse_data.c_str(), sse_data.size())) {
                    LOG_WARN("[SSE] Write failed for " << client_name);
                    return false;
                }
                *keepalive_counter = 0;
            } else if (++(*keepalive_counter) >= kKeepaliveEveryEmptyPops) {
                std::string keepalive = ": keepalive\n\n";
                if (!sink.write(keepalive.c_str(), keepalive.size())) {
                    LOG_WARN("[SSE] Keep-alive failed for " << client_name);
                    return false;
                }
                *keepalive_counter = 0;
            }

            return true;
        },
        [this, client_name, subscription](bool /*success*/) {
            subscription->unsubscribe();
            sse_client_count_--;
            LOG_INFO("[SSE] Client disconnected: " << client_name);
        });
}

std::string format_sse_event(const events::OutboundEvent &event) {
    std::string result = "event: " + event.type + "\n";
    if (event.event_id > 0) {
        result += "id: " + std::to_string(event.event_id) + "\n";
    }
    result += "data: " + event.message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n";
    return result;
}

}  // namespace http
}  // namespace agentlink
