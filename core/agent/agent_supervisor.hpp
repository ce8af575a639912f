#pragma once

#include <sys/types.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "agent_config.hpp"
#include "agent_process.hpp"

namespace agentlink {
namespace agent {

// AgentSupervisor owns the single agent process of one conversation.
//
// Handles are shared_ptr so the thread reading a killed process keeps valid descriptors and
// simply observes EOF. The supervisor drops its reference on kill; at most one handle is
// current at any time.
//
// "Needs history replay" is set on every spawn and on every kill, and cleared only through
// mark_history_replayed() for the handle that received the replay.
class AgentSupervisor {
public:
    // Immutable snapshot for status reporting
    struct SupervisionSnapshot {
        bool running = false;
        pid_t pid = -1;
        uint64_t spawn_count = 0;
        uint64_t kill_count = 0;
        bool needs_history_replay = false;
    };

    explicit AgentSupervisor(const AgentConfig &config);
    ~AgentSupervisor();

    AgentSupervisor(const AgentSupervisor &) = delete;
    AgentSupervisor &operator=(const AgentSupervisor &) = delete;

    // Return the live handle, (re)spawning if needed. nullptr on spawn failure (error set).
    std::shared_ptr<AgentProcess> ensure_started(std::string &error);

    // Interrupt path: SIGKILL, drop the handle, require replay. Never throws.
    void kill_and_invalidate();

    // Crash path: drop `handle` if it is still current (a newer handle is left alone)
    void discard(const std::shared_ptr<AgentProcess> &handle);

    // Graceful terminate with shutdown_timeout_ms, then SIGKILL
    void shutdown();

    bool needs_history_replay() const;
    void mark_history_replayed(const std::shared_ptr<AgentProcess> &handle);
    bool is_current(const std::shared_ptr<AgentProcess> &handle) const;

    SupervisionSnapshot snapshot() const;

    // Fixed startup arguments for the stream-json protocol
    std::vector<std::string> build_command_args() const;

    const AgentConfig &config() const { return config_; }

private:
    AgentConfig config_;

    mutable std::mutex start_mutex_;
    std::shared_ptr<AgentProcess> current_;
    bool needs_history_replay_ = true;
    uint64_t spawn_count_ = 0;
    uint64_t kill_count_ = 0;
};

}  // namespace agent
}  // namespace agentlink
