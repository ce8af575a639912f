#include "runtime.hpp"

#include <string.h>

#include <chrono>
#include <sstream>
#include <thread>

#include "agent/summarizer.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace agentlink {
namespace runtime {

std::string generate_session_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    std::ostringstream oss;
    oss << "session-" << std::hex << ms;
    return oss.str();
}

Runtime::Runtime(const RuntimeConfig &config) : config_(config), session_id_(generate_session_id()) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing agentlink (session " << session_id_ << ")");

    if (!init_conversation(error)) {
        return false;
    }

    if (!init_agent(error)) {
        return false;
    }

    if (!init_coordinator(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_conversation(std::string &error) {
    store_ = std::make_unique<conversation::ConversationStore>(config_.conversation.directory,
                                                               config_.conversation.id);
    if (!store_->initialize(error)) {
        error = "Conversation store initialization failed: " + error;
        return false;
    }

    LOG_INFO("[Runtime] Conversation " << store_->id() << " (" << store_->size() << " entries) at "
                                       << store_->file_path());
    return true;
}

bool Runtime::init_agent(std::string & /*error*/) {
    std::shared_ptr<agent::ISummarizer> summarizer;
    if (config_.summarizer.enabled) {
        summarizer = std::make_shared<agent::AnthropicSummarizer>(config_.summarizer);
        LOG_INFO("[Runtime] Tool summaries via " << config_.summarizer.model);
    } else {
        LOG_INFO("[Runtime] Tool summarizer disabled in config");
    }

    // The agent process itself is spawned lazily on the first request
    agent_client_ = std::make_unique<agent::AgentClient>(config_.agent, summarizer);

    if (config_.tts.enabled) {
        tts_ = std::make_unique<speech::CommandTextToSpeech>(config_.tts);
        LOG_INFO("[Runtime] Text-to-speech via " << config_.tts.command << " (" << config_.tts.format << ")");
    } else {
        LOG_INFO("[Runtime] Text-to-speech disabled in config");
    }
    return true;
}

bool Runtime::init_coordinator(std::string & /*error*/) {
    event_stream_ = std::make_shared<events::EventStream>(static_cast<size_t>(config_.http.sse_queue_size),
                                                          static_cast<size_t>(config_.http.max_sse_clients));
    LOG_INFO("[Runtime] Event stream created (max " << event_stream_->max_subscribers() << " subscribers)");

    conversation::CoordinatorOptions options;
    options.session_id = session_id_;
    options.working_dir = config_.agent.working_directory;
    options.tool_profile = config_.agent.permission_mode;
    options.audio_chunk_size = config_.tts.chunk_size;

    coordinator_ = std::make_unique<conversation::RequestCoordinator>(*agent_client_, *store_, *event_stream_,
                                                                      tts_.get(), options);
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, *coordinator_, *store_, event_stream_,
                                                          &agent_client_->supervisor());

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << http_server_->get_port());
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            int signo = SignalHandler::last_signal();
            if (signo != 0) {
                LOG_INFO("[Runtime] " << strsignal(signo) << " received, stopping...");
            } else {
                LOG_INFO("[Runtime] Shutdown requested, stopping...");
            }
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    // Stop HTTP first so no new requests arrive during teardown
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (coordinator_) {
        LOG_INFO("[Runtime] Stopping request coordinator");
        coordinator_->shutdown();
    }

    LOG_INFO("[Runtime] Shutdown complete");
}

}  // namespace runtime
}  // namespace agentlink
