#pragma once

#include <string>
#include <vector>

#include "../agent/agent_config.hpp"
#include "../agent/summarizer.hpp"
#include "../speech/text_to_speech.hpp"

namespace agentlink {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct ConversationConfig {
    std::string directory = "data/conversations";  // One <id>.yml per conversation
    std::string id;                                 // Resume this conversation (empty = new id)
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 40;                           // Worker thread pool size
    int max_sse_clients = 32;                            // Concurrent /v0/events subscribers
    int sse_queue_size = 256;                            // Per-subscriber buffered messages
};

struct RuntimeConfig {
    agent::AgentConfig agent;
    agent::SummarizerConfig summarizer;
    speech::TtsConfig tts;
    ConversationConfig conversation;
    HttpConfig http;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace agentlink
