#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "../logging/logger.hpp"

namespace agentlink {
namespace runtime {

namespace {

// Scalar or sequence -> list of strings
std::vector<std::string> read_string_list(const YAML::Node &node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        // "Bash Read Edit" is accepted as well as a YAML list
        std::istringstream iss(node.as<std::string>());
        std::string word;
        while (iss >> word) {
            out.push_back(word);
        }
    }
    return out;
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Agent settings
    if (config.agent.command.empty()) {
        error = "agent.command must not be empty";
        return false;
    }
    if (config.agent.permission_mode.empty()) {
        error = "agent.permission_mode must not be empty";
        return false;
    }
    if (config.agent.poll_interval_ms < 1 || config.agent.poll_interval_ms > 1000) {
        error = "agent.poll_interval_ms must be between 1 and 1000";
        return false;
    }
    if (config.agent.startup_settle_ms < 0) {
        error = "agent.startup_settle_ms must be >= 0";
        return false;
    }
    if (config.agent.shutdown_timeout_ms < 100 || config.agent.shutdown_timeout_ms > 30000) {
        error = "agent.shutdown_timeout_ms must be between 100 and 30000";
        return false;
    }
    if (config.agent.kill_timeout_ms < 100) {
        error = "agent.kill_timeout_ms must be >= 100";
        return false;
    }
    if (config.agent.write_timeout_ms < 100) {
        error = "agent.write_timeout_ms must be >= 100";
        return false;
    }

    // Summarizer settings
    if (config.summarizer.enabled) {
        if (config.summarizer.model.empty()) {
            error = "summarizer.model must not be empty";
            return false;
        }
        if (config.summarizer.max_tokens < 1) {
            error = "summarizer.max_tokens must be >= 1";
            return false;
        }
        if (config.summarizer.timeout_ms < 100) {
            error = "summarizer.timeout_ms must be >= 100";
            return false;
        }
        if (config.summarizer.api_url.rfind("http://", 0) != 0 && config.summarizer.api_url.rfind("https://", 0) != 0) {
            error = "summarizer.api_url must start with http:// or https://";
            return false;
        }
    }

    // TTS settings
    if (config.tts.enabled) {
        if (config.tts.command.empty()) {
            error = "tts enabled but tts.command not specified";
            return false;
        }
        if (config.tts.timeout_ms < 100) {
            error = "tts.timeout_ms must be >= 100";
            return false;
        }
        if (config.tts.chunk_size < 1024) {
            error = "tts.chunk_size must be >= 1024";
            return false;
        }
    }

    // Conversation settings
    if (config.conversation.directory.empty()) {
        error = "conversation.directory must not be empty";
        return false;
    }
    if (config.conversation.id.find('/') != std::string::npos ||
        config.conversation.id.find("..") != std::string::npos) {
        error = "conversation.id must be a plain name";
        return false;
    }

    // HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
        if (config.http.max_sse_clients < 1) {
            error = "http.max_sse_clients must be at least 1";
            return false;
        }
        if (config.http.thread_pool_size <= config.http.max_sse_clients) {
            error = "http.thread_pool_size must exceed http.max_sse_clients";
            return false;
        }
        if (config.http.sse_queue_size < 1) {
            error = "http.sse_queue_size must be at least 1";
            return false;
        }
    }

    // Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"agent", "summarizer", "tts", "conversation", "http", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load agent config
        if (yaml["agent"]) {
            const auto &agent = yaml["agent"];
            if (agent["command"]) {
                config.agent.command = agent["command"].as<std::string>();
            }
            if (agent["args"]) {
                config.agent.args = read_string_list(agent["args"]);
            }
            if (agent["working_directory"]) {
                config.agent.working_directory = agent["working_directory"].as<std::string>();
            }
            if (agent["allowed_tools"]) {
                config.agent.allowed_tools = read_string_list(agent["allowed_tools"]);
            }
            if (agent["permission_mode"]) {
                config.agent.permission_mode = agent["permission_mode"].as<std::string>();
            }
            if (agent["system_prompt"]) {
                config.agent.system_prompt = agent["system_prompt"].as<std::string>();
            }
            if (agent["startup_settle_ms"]) {
                config.agent.startup_settle_ms = agent["startup_settle_ms"].as<int>();
            }
            if (agent["shutdown_timeout_ms"]) {
                config.agent.shutdown_timeout_ms = agent["shutdown_timeout_ms"].as<int>();
            }
            if (agent["kill_timeout_ms"]) {
                config.agent.kill_timeout_ms = agent["kill_timeout_ms"].as<int>();
            }
            if (agent["poll_interval_ms"]) {
                config.agent.poll_interval_ms = agent["poll_interval_ms"].as<int>();
            }
            if (agent["write_timeout_ms"]) {
                config.agent.write_timeout_ms = agent["write_timeout_ms"].as<int>();
            }
        }

        // Load summarizer config
        if (yaml["summarizer"]) {
            const auto &summarizer = yaml["summarizer"];
            if (summarizer["enabled"]) {
                config.summarizer.enabled = summarizer["enabled"].as<bool>();
            }
            if (summarizer["api_url"]) {
                config.summarizer.api_url = summarizer["api_url"].as<std::string>();
            }
            if (summarizer["api_key"]) {
                config.summarizer.api_key = summarizer["api_key"].as<std::string>();
                LOG_WARN("[Config] summarizer.api_key set in file; prefer summarizer.api_key_env");
            }
            if (summarizer["api_key_env"]) {
                config.summarizer.api_key_env = summarizer["api_key_env"].as<std::string>();
            }
            if (summarizer["model"]) {
                config.summarizer.model = summarizer["model"].as<std::string>();
            }
            if (summarizer["max_tokens"]) {
                config.summarizer.max_tokens = summarizer["max_tokens"].as<int>();
            }
            if (summarizer["timeout_ms"]) {
                config.summarizer.timeout_ms = summarizer["timeout_ms"].as<int>();
            }
        }

        // Key from environment variable if not in config
        if (config.summarizer.enabled && config.summarizer.api_key.empty() && !config.summarizer.api_key_env.empty()) {
            const char *key_env = std::getenv(config.summarizer.api_key_env.c_str());
            if (key_env != nullptr) {
                config.summarizer.api_key = key_env;
            }
        }

        // Load TTS config
        if (yaml["tts"]) {
            const auto &tts = yaml["tts"];
            if (tts["enabled"]) {
                config.tts.enabled = tts["enabled"].as<bool>();
            }
            if (tts["command"]) {
                config.tts.command = tts["command"].as<std::string>();
            }
            if (tts["args"]) {
                config.tts.args = read_string_list(tts["args"]);
            }
            if (tts["timeout_ms"]) {
                config.tts.timeout_ms = tts["timeout_ms"].as<int>();
            }
            if (tts["format"]) {
                config.tts.format = tts["format"].as<std::string>();
            }
            if (tts["chunk_size"]) {
                config.tts.chunk_size = tts["chunk_size"].as<size_t>();
            }
        }

        // Load conversation config
        if (yaml["conversation"]) {
            if (yaml["conversation"]["directory"]) {
                config.conversation.directory = yaml["conversation"]["directory"].as<std::string>();
            }
            if (yaml["conversation"]["id"]) {
                config.conversation.id = yaml["conversation"]["id"].as<std::string>();
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            if (yaml["http"]["enabled"]) {
                config.http.enabled = yaml["http"]["enabled"].as<bool>();
            }
            if (yaml["http"]["bind"]) {
                config.http.bind = yaml["http"]["bind"].as<std::string>();
            }
            if (yaml["http"]["port"]) {
                config.http.port = yaml["http"]["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (yaml["http"]["cors_allowed_origins"]) {
                const auto &origins_node = yaml["http"]["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (yaml["http"]["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = yaml["http"]["cors_allow_credentials"].as<bool>();
            }
            if (yaml["http"]["thread_pool_size"]) {
                config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
            }
            if (yaml["http"]["max_sse_clients"]) {
                config.http.max_sse_clients = yaml["http"]["max_sse_clients"].as<int>();
            }
            if (yaml["http"]["sse_queue_size"]) {
                config.http.sse_queue_size = yaml["http"]["sse_queue_size"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Agent: " << config.agent.command << " (" << config.agent.allowed_tools.size()
                                    << " tools, " << config.agent.permission_mode << ")");
        LOG_INFO("[Config] Summarizer: " << (config.summarizer.enabled ? config.summarizer.model : "disabled")
                                         << (config.summarizer.enabled && config.summarizer.api_key.empty()
                                                 ? " (no API key, using placeholders)"
                                                 : ""));
        LOG_INFO("[Config] TTS: " << (config.tts.enabled ? config.tts.command : "disabled"));

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace agentlink
