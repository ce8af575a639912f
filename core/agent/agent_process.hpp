#pragma once

#include <sys/types.h>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "line_stdio_client.hpp"

namespace agentlink {
namespace agent {

// AgentProcess manages the lifecycle of one agent child process
// Responsibilities:
// - Spawn process with redirected stdin/stdout (stderr inherited)
// - Liveness checks that reap an exited child
// - Graceful (EOF -> SIGTERM -> SIGKILL) and immediate (SIGKILL) termination
//
// The pid state is mutex-protected so kill() may race with the thread that owns the pipes.
// Pipe descriptors stay open until destruction, so a concurrent reader sees EOF, never a closed fd.
class AgentProcess {
public:
    AgentProcess(const std::string &name, const std::string &command, const std::vector<std::string> &args = {},
                 const std::string &working_directory = "");
    ~AgentProcess();

    // Delete copy/move
    AgentProcess(const AgentProcess &) = delete;
    AgentProcess &operator=(const AgentProcess &) = delete;

    // Spawn the process
    // Returns true on success, false on failure (sets error_)
    bool spawn();

    // Check if process is still running (reaps it if it has exited)
    bool is_running();

    // Shutdown sequence: EOF -> SIGTERM -> wait -> SIGKILL
    void terminate(int grace_ms);

    // Interrupt path: SIGKILL now, then reap for up to wait_ms. Safe on a dead process.
    void kill(int wait_ms);

    LineStdioClient &client() { return client_; }

    const std::string &name() const { return name_; }
    pid_t pid() const;
    std::optional<int> exit_status() const;
    const std::string &last_error() const { return error_; }

private:
    std::string name_;
    std::string command_;
    std::vector<std::string> args_;
    std::string working_directory_;
    std::string error_;

    LineStdioClient client_;

    mutable std::mutex pid_mutex_;
    pid_t pid_;
    std::optional<int> exit_status_;
    int stdin_write_fd_;
    int stdout_read_fd_;

    bool wait_for_exit(int timeout_ms);
    bool reap_locked(bool block);
    void signal_locked(int sig);
};

// Resolve a command the way execvp would. Returns empty if nothing executable is found.
std::string resolve_executable(const std::string &command);

}  // namespace agent
}  // namespace agentlink
