// agentlink
// Conversation runtime for a persistent Claude CLI agent, with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "agentlink.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: agentlink [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: agentlink.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("agentlink v0 starting...");
    LOG_INFO("Loading config: " << config_path);

    agentlink::runtime::RuntimeConfig config;
    std::string error;

    if (!agentlink::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    agentlink::logging::Logger::set_level(agentlink::logging::string_to_level(config.logging.level));

    // Installed before the runtime spawns anything so Ctrl+C during startup is honored
    agentlink::runtime::SignalHandler::install();

    agentlink::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Session: " << runtime.session_id());
    LOG_INFO("  Conversation: " << runtime.get_store().id() << " (" << runtime.get_store().size() << " entries)");
    LOG_INFO("  Agent: " << config.agent.command << " [" << config.agent.permission_mode << "]");

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
