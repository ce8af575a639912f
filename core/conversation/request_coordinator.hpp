#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "agent/i_agent_client.hpp"
#include "conversation_store.hpp"
#include "events/i_outbound_channel.hpp"
#include "speech/text_to_speech.hpp"

namespace agentlink {
namespace conversation {

struct CoordinatorOptions {
    std::string session_id;
    std::string working_dir;
    std::string tool_profile;    // Reported in session_info (the agent permission mode)
    size_t audio_chunk_size = 32768;
};

/**
 * @brief Per-connection request lifecycle
 *
 * States: Idle and Processing(current request id). At most one request is current; a new
 * message while Processing first interrupts the current one.
 *
 * Each request runs on its own worker thread. Every request-scoped emission carries the
 * originating id and is dropped (logged) when that id is no longer current. The id check
 * and the channel push happen under the same lock, so once an interrupt or a newer request
 * has replaced the current id nothing more from the old request reaches the client.
 *
 * handle_user_message / handle_interrupt / handle_message are serialized against each other.
 */
class RequestCoordinator {
public:
    struct Status {
        bool processing = false;
        std::string current_request_id;
        uint64_t requests_started = 0;
        uint64_t requests_completed = 0;
        uint64_t requests_failed = 0;
        uint64_t requests_interrupted = 0;
        uint64_t stale_messages_dropped = 0;
    };

    RequestCoordinator(agent::IAgentClient &client, ConversationStore &store, events::IOutboundChannel &channel,
                       speech::ITextToSpeech *tts = nullptr, CoordinatorOptions options = {});
    ~RequestCoordinator();

    RequestCoordinator(const RequestCoordinator &) = delete;
    RequestCoordinator &operator=(const RequestCoordinator &) = delete;

    // Start a request. Returns its id, or nullopt for empty content (an error message is sent).
    std::optional<std::string> handle_user_message(const std::string &content);

    // Interrupt the current request. False (no-op) when Idle or already interrupted.
    bool handle_interrupt(const std::string &reason = "user_stopped");

    // Route a typed inbound message ({"type": "user_message" | "interrupt" | "config_update", ...})
    bool handle_message(const nlohmann::json &message);

    // Acknowledge a client settings update with config_updated. The running agent keeps the
    // startup configuration; false (error sent) when `config` is not an object.
    bool handle_config_update(const nlohmann::json &config);

    // Request-scoped emissions; false when the message was dropped as stale
    bool send_tool_use(const std::string &request_id, const std::string &tool, const nlohmann::json &input,
                       const std::string &summary);
    bool send_tool_summary(const std::string &request_id, const std::string &tool, const nlohmann::json &input,
                           const std::string &summary);
    bool send_text_block(const std::string &request_id, const std::string &text, bool is_final);
    bool send_tool_input_progress(const std::string &request_id, const std::string &tool_id,
                                  const std::string &partial_json, const nlohmann::json &input);
    bool send_thinking(const std::string &request_id, const std::string &text);
    bool send_assistant_message(const std::string &request_id, const std::string &content,
                                const nlohmann::json &tool_calls);
    bool send_processing(const std::string &request_id, const std::string &status);
    bool send_error(const std::string &request_id, const std::string &message);
    bool stream_synthesized_audio(const std::string &request_id, const std::string &text);

    // Connection-scoped
    nlohmann::json session_info() const;
    void send_session_info();
    void send_connection_error(const std::string &message);

    Status state() const;
    bool is_current(const std::string &request_id) const;

    // Block until no request is current and all workers have finished
    bool wait_until_idle(int timeout_ms);

    // Interrupt, join all workers, clean up the agent client. Idempotent.
    void shutdown();

private:
    struct RequestContext {
        std::string id;
        std::atomic<bool> interrupted{false};
        agent::CancellationToken cancel;
        std::thread worker;
        std::atomic<bool> done{false};
    };

    void run_request(std::shared_ptr<RequestContext> ctx, std::string content,
                     std::vector<agent::HistoryEntry> history);
    agent::StreamCallbacks make_callbacks(const std::string &request_id);

    bool interrupt_locked(const std::string &reason);  // control_mutex_ held
    bool emit_if_current(const std::string &request_id, const nlohmann::json &message);
    void reap_finished_workers();
    std::string next_request_id();

    agent::IAgentClient &client_;
    ConversationStore &store_;
    events::IOutboundChannel &channel_;
    speech::ITextToSpeech *tts_;
    CoordinatorOptions options_;

    // Serializes inbound handling (one message at a time per connection)
    std::mutex control_mutex_;

    // Guards current_, workers_, counters, and channel pushes
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::shared_ptr<RequestContext> current_;
    std::vector<std::shared_ptr<RequestContext>> workers_;
    Status counters_;

    std::atomic<uint64_t> request_seq_{0};
    std::atomic<bool> shut_down_{false};
};

}  // namespace conversation
}  // namespace agentlink
