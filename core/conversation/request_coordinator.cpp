#include "request_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <sstream>

#include "logging/logger.hpp"
#include "outbound_messages.hpp"

namespace agentlink {
namespace conversation {

namespace {

bool is_blank(const std::string &s) { return s.find_first_not_of(" \t\r\n") == std::string::npos; }

}  // namespace

RequestCoordinator::RequestCoordinator(agent::IAgentClient &client, ConversationStore &store,
                                       events::IOutboundChannel &channel, speech::ITextToSpeech *tts,
                                       CoordinatorOptions options)
    : client_(client), store_(store), channel_(channel), tts_(tts), options_(std::move(options)) {}

RequestCoordinator::~RequestCoordinator() { shutdown(); }

std::string RequestCoordinator::next_request_id() {
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    std::ostringstream oss;
    oss << "req-" << std::hex << now_ms << "-" << std::dec << ++request_seq_;
    return oss.str();
}

//=============================================================================
// Inbound
//=============================================================================

std::optional<std::string> RequestCoordinator::handle_user_message(const std::string &content) {
    std::lock_guard<std::mutex> control(control_mutex_);

    if (shut_down_.load()) {
        LOG_WARN("[Coordinator] Message rejected: coordinator is shut down");
        return std::nullopt;
    }

    if (is_blank(content)) {
        send_connection_error("Empty message received");
        return std::nullopt;
    }

    reap_finished_workers();

    bool busy = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy = current_ != nullptr;
    }
    if (busy) {
        LOG_INFO("[Coordinator] New message while processing, interrupting current request");
        interrupt_locked("superseded");
    }

    // Snapshot before the new user entry: the prompt itself is sent separately
    auto history = store_.replay_history();
    store_.add_user_message(content);

    auto ctx = std::make_shared<RequestContext>();
    ctx->id = next_request_id();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = ctx;
        workers_.push_back(ctx);
        counters_.requests_started++;
        channel_.send(messages::processing("thinking", ctx->id));
        ctx->worker = std::thread(&RequestCoordinator::run_request, this, ctx, content, std::move(history));
    }

    LOG_INFO("[Coordinator] Request " << ctx->id << " started (" << content.size() << " chars)");
    return ctx->id;
}

bool RequestCoordinator::handle_interrupt(const std::string &reason) {
    std::lock_guard<std::mutex> control(control_mutex_);
    return interrupt_locked(reason);
}

bool RequestCoordinator::interrupt_locked(const std::string &reason) {
    std::shared_ptr<RequestContext> ctx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_) {
            LOG_INFO("[Coordinator] Interrupt (" << reason << ") ignored: no active request");
            return false;
        }
        ctx = current_;
        ctx->interrupted.store(true);
        current_.reset();
        counters_.requests_interrupted++;
    }

    LOG_INFO("[Coordinator] Interrupting request " << ctx->id << " (" << reason << ")");

    // Both signals: the kill unblocks a read in progress, the token stops the worker between reads
    client_.interrupt_and_restart();
    ctx->cancel.cancel();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel_.send(messages::interrupted(reason, ctx->id));
    }
    idle_cv_.notify_all();
    return true;
}

bool RequestCoordinator::handle_message(const nlohmann::json &message) {
    if (!message.is_object()) {
        send_connection_error("Invalid message format");
        return false;
    }

    auto type_it = message.find("type");
    std::string type = (type_it != message.end() && type_it->is_string()) ? type_it->get<std::string>() : "";

    if (type == "user_message") {
        auto content_it = message.find("content");
        std::string content =
            (content_it != message.end() && content_it->is_string()) ? content_it->get<std::string>() : "";
        return handle_user_message(content).has_value();
    }

    if (type == "interrupt") {
        auto reason_it = message.find("reason");
        std::string reason =
            (reason_it != message.end() && reason_it->is_string()) ? reason_it->get<std::string>() : "user_stopped";
        return handle_interrupt(reason);
    }

    if (type == "config_update") {
        auto config_it = message.find("config");
        return handle_config_update(config_it != message.end() ? *config_it : nlohmann::json::object());
    }

    LOG_WARN("[Coordinator] Unknown message type: " << type);
    send_connection_error("Unknown message type: " + type);
    return false;
}

//=============================================================================
// Worker
//=============================================================================

agent::StreamCallbacks RequestCoordinator::make_callbacks(const std::string &request_id) {
    agent::StreamCallbacks callbacks;
    callbacks.on_tool_use = [this, request_id](const std::string &tool, const nlohmann::json &input,
                                               const std::string &summary) {
        send_tool_use(request_id, tool, input, summary);
    };
    callbacks.on_tool_summary_update = [this, request_id](const std::string &tool, const nlohmann::json &input,
                                                          const std::string &summary) {
        send_tool_summary(request_id, tool, input, summary);
    };
    callbacks.on_text_block = [this, request_id](const std::string &text, bool is_final) {
        send_text_block(request_id, text, is_final);
    };
    callbacks.on_tool_input_progress = [this, request_id](const std::string &tool_id, const std::string &partial,
                                                          const nlohmann::json &input) {
        send_tool_input_progress(request_id, tool_id, partial, input);
    };
    callbacks.on_thinking_block = [this, request_id](const std::string &text) { send_thinking(request_id, text); };
    return callbacks;
}

void RequestCoordinator::run_request(std::shared_ptr<RequestContext> ctx, std::string content,
                                     std::vector<agent::HistoryEntry> history) {
    const std::string request_id = ctx->id;
    bool succeeded = false;

    agent::InterruptPredicate is_interrupted = [this, ctx]() {
        return ctx->interrupted.load() || !is_current(ctx->id);
    };

    try {
        auto outcome = client_.execute_streaming(content, make_callbacks(request_id), history, is_interrupted,
                                                 &ctx->cancel);

        if (outcome.success) {
            auto tool_calls = agent::tool_calls_to_json(outcome.tool_calls);

            bool recorded = false;
            {
                // A superseded request must not land in history after its successor's user entry
                std::lock_guard<std::mutex> lock(mutex_);
                if (current_ == ctx) {
                    store_.add_assistant_message(outcome.response, tool_calls);
                    recorded = true;
                }
            }

            if (recorded) {
                if (!outcome.already_sent_as_text_block) {
                    send_assistant_message(request_id, outcome.response, tool_calls);
                }
                send_processing(request_id, "complete");
                if (tts_ && !outcome.response.empty()) {
                    stream_synthesized_audio(request_id, outcome.response);
                }
                succeeded = true;
            } else {
                LOG_INFO("[Coordinator] Request " << request_id << " finished after being superseded, result dropped");
            }
        } else if (ctx->interrupted.load()) {
            LOG_INFO("[Coordinator] Request " << request_id << " stopped: " << outcome.response << " ("
                                              << outcome.tool_calls.size() << " tool calls)");
        } else {
            LOG_WARN("[Coordinator] Request " << request_id << " failed: " << outcome.response);
            send_error(request_id, outcome.response);
        }
    } catch (const std::exception &e) {
        LOG_ERROR("[Coordinator] Error handling request " << request_id << ": " << e.what());
        send_error(request_id, std::string("Error processing message: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ == ctx) {
            current_.reset();
        }
        if (succeeded) {
            counters_.requests_completed++;
        } else if (!ctx->interrupted.load()) {
            counters_.requests_failed++;
        }
        ctx->done.store(true);
    }
    idle_cv_.notify_all();
}

void RequestCoordinator::reap_finished_workers() {
    std::vector<std::shared_ptr<RequestContext>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::partition(workers_.begin(), workers_.end(),
                                 [](const std::shared_ptr<RequestContext> &w) { return !w->done.load(); });
        std::move(it, workers_.end(), std::back_inserter(finished));
        workers_.erase(it, workers_.end());
    }
    for (auto &ctx : finished) {
        if (ctx->worker.joinable()) {
            ctx->worker.join();
        }
    }
}

bool RequestCoordinator::handle_config_update(const nlohmann::json &config) {
    if (!config.is_object()) {
        LOG_WARN("[Coordinator] Rejecting config update: " << config.dump());
        send_connection_error("Failed to update configuration: config must be an object");
        return false;
    }

    for (const char *key : {"working_directory", "allowed_tools", "permission_mode"}) {
        auto it = config.find(key);
        if (it != config.end()) {
            LOG_INFO("[Coordinator] Config update " << key << "=" << it->dump()
                                                    << " acknowledged; takes effect on the next session");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    channel_.send(messages::config_updated(true));
    return true;
}

//=============================================================================
// Outbound
//=============================================================================

bool RequestCoordinator::emit_if_current(const std::string &request_id, const nlohmann::json &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_ || current_->id != request_id) {
        counters_.stale_messages_dropped++;
        LOG_DEBUG("[Coordinator] Dropping stale " << message.value("type", std::string("message"))
                                                  << " from request " << request_id);
        return false;
    }
    channel_.send(message);
    return true;
}

bool RequestCoordinator::send_tool_use(const std::string &request_id, const std::string &tool,
                                       const nlohmann::json &input, const std::string &summary) {
    return emit_if_current(request_id, messages::tool_use(tool, input, summary, request_id));
}

bool RequestCoordinator::send_tool_summary(const std::string &request_id, const std::string &tool,
                                           const nlohmann::json &input, const std::string &summary) {
    return emit_if_current(request_id, messages::tool_summary(tool, input, summary, request_id));
}

bool RequestCoordinator::send_text_block(const std::string &request_id, const std::string &text, bool is_final) {
    return emit_if_current(request_id, messages::text_block(text, is_final, request_id));
}

bool RequestCoordinator::send_tool_input_progress(const std::string &request_id, const std::string &tool_id,
                                                  const std::string &partial_json, const nlohmann::json &input) {
    return emit_if_current(request_id, messages::tool_input_progress(tool_id, partial_json, input, request_id));
}

bool RequestCoordinator::send_thinking(const std::string &request_id, const std::string &text) {
    return emit_if_current(request_id, messages::thinking(text, request_id));
}

bool RequestCoordinator::send_assistant_message(const std::string &request_id, const std::string &content,
                                                const nlohmann::json &tool_calls) {
    return emit_if_current(request_id, messages::assistant_message(content, tool_calls, request_id));
}

bool RequestCoordinator::send_processing(const std::string &request_id, const std::string &status) {
    return emit_if_current(request_id, messages::processing(status, request_id));
}

bool RequestCoordinator::send_error(const std::string &request_id, const std::string &message) {
    return emit_if_current(request_id, messages::error(message, request_id));
}

bool RequestCoordinator::stream_synthesized_audio(const std::string &request_id, const std::string &text) {
    if (!tts_) {
        return false;
    }
    if (!is_current(request_id)) {
        LOG_DEBUG("[Coordinator] Skipping speech for stale request " << request_id);
        return false;
    }

    std::string audio;
    std::string error;
    if (!tts_->synthesize(text, audio, error)) {
        LOG_WARN("[Coordinator] Speech synthesis failed: " << error);
        return false;
    }

    const size_t chunk_size = options_.audio_chunk_size > 0 ? options_.audio_chunk_size : audio.size();
    int index = 0;
    for (size_t offset = 0; offset < audio.size(); offset += chunk_size, ++index) {
        const bool last = offset + chunk_size >= audio.size();
        if (!emit_if_current(request_id,
                             messages::audio(audio.substr(offset, chunk_size), tts_->format(), index, last, request_id))) {
            LOG_INFO("[Coordinator] Audio stream for " << request_id << " cut at chunk " << index);
            return false;
        }
    }
    LOG_DEBUG("[Coordinator] Streamed " << index << " audio chunks for " << request_id);
    return true;
}

nlohmann::json RequestCoordinator::session_info() const {
    return messages::session_info(options_.session_id, options_.working_dir, store_.id(), options_.tool_profile);
}

void RequestCoordinator::send_session_info() {
    auto message = session_info();
    std::lock_guard<std::mutex> lock(mutex_);
    channel_.send(message);
}

void RequestCoordinator::send_connection_error(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_.send(messages::error(message));
}

//=============================================================================
// Status / lifecycle
//=============================================================================

RequestCoordinator::Status RequestCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Status status = counters_;
    status.processing = current_ != nullptr;
    status.current_request_id = current_ ? current_->id : "";
    return status;
}

bool RequestCoordinator::is_current(const std::string &request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ && current_->id == request_id;
}

bool RequestCoordinator::wait_until_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
        if (current_) {
            return false;
        }
        return std::all_of(workers_.begin(), workers_.end(),
                           [](const std::shared_ptr<RequestContext> &w) { return w->done.load(); });
    });
}

void RequestCoordinator::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }

    LOG_INFO("[Coordinator] Shutting down");
    {
        std::lock_guard<std::mutex> control(control_mutex_);
        interrupt_locked("shutdown");
    }

    std::vector<std::shared_ptr<RequestContext>> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto &ctx : workers) {
        if (ctx->worker.joinable()) {
            ctx->worker.join();
        }
    }

    client_.cleanup();
}

}  // namespace conversation
}  // namespace agentlink
