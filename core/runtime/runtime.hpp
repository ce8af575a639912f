#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "agent/agent_client.hpp"
#include "config.hpp"
#include "conversation/conversation_store.hpp"
#include "conversation/request_coordinator.hpp"
#include "events/event_stream.hpp"
#include "http/server.hpp"
#include "speech/text_to_speech.hpp"

namespace agentlink {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Initialize all components (store, agent client, coordinator, HTTP)
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop HTTP, interrupt any request, shut the agent down
    void shutdown();

    conversation::RequestCoordinator &get_coordinator() { return *coordinator_; }
    conversation::ConversationStore &get_store() { return *store_; }
    events::EventStream &get_event_stream() { return *event_stream_; }
    const std::string &session_id() const { return session_id_; }

private:
    bool init_conversation(std::string &error);
    bool init_agent(std::string &error);
    bool init_coordinator(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;
    std::string session_id_;

    std::unique_ptr<conversation::ConversationStore> store_;
    std::unique_ptr<agent::AgentClient> agent_client_;
    std::shared_ptr<events::EventStream> event_stream_;  // Shared with coordinator + HTTP
    std::unique_ptr<speech::ITextToSpeech> tts_;
    std::unique_ptr<conversation::RequestCoordinator> coordinator_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

// "session-<hex ms>", unique per process start
std::string generate_session_id();

}  // namespace runtime
}  // namespace agentlink
