#include "agent_supervisor.hpp"

#include <chrono>
#include <sstream>
#include <thread>

#include "logging/logger.hpp"

namespace agentlink {
namespace agent {

AgentSupervisor::AgentSupervisor(const AgentConfig &config) : config_(config) {}

AgentSupervisor::~AgentSupervisor() { shutdown(); }

std::vector<std::string> AgentSupervisor::build_command_args() const {
    std::ostringstream tools;
    for (size_t i = 0; i < config_.allowed_tools.size(); ++i) {
        if (i > 0) {
            tools << " ";
        }
        tools << config_.allowed_tools[i];
    }

    std::vector<std::string> args = {"-p",
                                     "--input-format",
                                     "stream-json",
                                     "--output-format",
                                     "stream-json",
                                     "--verbose",  // Required for stream-json
                                     "--allowedTools",
                                     tools.str(),
                                     "--permission-mode",
                                     config_.permission_mode,
                                     "--system-prompt",
                                     config_.system_prompt};
    args.insert(args.end(), config_.args.begin(), config_.args.end());
    return args;
}

std::shared_ptr<AgentProcess> AgentSupervisor::ensure_started(std::string &error) {
    std::lock_guard<std::mutex> lock(start_mutex_);

    if (current_ && current_->is_running()) {
        return current_;
    }

    if (current_) {
        LOG_WARN("[Supervisor] Agent process exited (status "
                 << (current_->exit_status() ? std::to_string(*current_->exit_status()) : std::string("unknown"))
                 << "), restarting");
        current_->terminate(config_.shutdown_timeout_ms);
        current_.reset();
    }

    auto process = std::make_shared<AgentProcess>("agent", config_.command, build_command_args(),
                                                  config_.working_directory);
    if (!process->spawn()) {
        error = process->last_error();
        return nullptr;
    }

    current_ = process;
    needs_history_replay_ = true;
    ++spawn_count_;

    // Let the CLI finish initialization before the first write
    if (config_.startup_settle_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.startup_settle_ms));
    }

    LOG_INFO("[Supervisor] Agent process started (PID " << process->pid() << ", spawn #" << spawn_count_ << ")");
    return current_;
}

void AgentSupervisor::kill_and_invalidate() {
    std::shared_ptr<AgentProcess> victim;
    {
        std::lock_guard<std::mutex> lock(start_mutex_);
        victim = std::move(current_);
        current_.reset();
        needs_history_replay_ = true;
        if (victim) {
            ++kill_count_;
        }
    }

    if (!victim) {
        LOG_DEBUG("[Supervisor] kill_and_invalidate: no agent process");
        return;
    }

    LOG_INFO("[Supervisor] Interrupting agent - killing PID " << victim->pid());
    victim->kill(config_.kill_timeout_ms);
    LOG_INFO("[Supervisor] Agent process killed - will restart on next request");
}

void AgentSupervisor::discard(const std::shared_ptr<AgentProcess> &handle) {
    std::shared_ptr<AgentProcess> victim;
    {
        std::lock_guard<std::mutex> lock(start_mutex_);
        if (!handle || current_ != handle) {
            return;
        }
        victim = std::move(current_);
        current_.reset();
        needs_history_replay_ = true;
    }
    LOG_WARN("[Supervisor] Discarding agent process (PID " << victim->pid() << ")");
    victim->kill(config_.kill_timeout_ms);
}

void AgentSupervisor::shutdown() {
    std::shared_ptr<AgentProcess> process;
    {
        std::lock_guard<std::mutex> lock(start_mutex_);
        process = std::move(current_);
        current_.reset();
        needs_history_replay_ = true;
    }
    if (process) {
        LOG_INFO("[Supervisor] Terminating agent process");
        process->terminate(config_.shutdown_timeout_ms);
    }
}

bool AgentSupervisor::needs_history_replay() const {
    std::lock_guard<std::mutex> lock(start_mutex_);
    return needs_history_replay_;
}

void AgentSupervisor::mark_history_replayed(const std::shared_ptr<AgentProcess> &handle) {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (handle && current_ == handle) {
        needs_history_replay_ = false;
    }
}

bool AgentSupervisor::is_current(const std::shared_ptr<AgentProcess> &handle) const {
    std::lock_guard<std::mutex> lock(start_mutex_);
    return handle && current_ == handle;
}

AgentSupervisor::SupervisionSnapshot AgentSupervisor::snapshot() const {
    std::lock_guard<std::mutex> lock(start_mutex_);
    SupervisionSnapshot snap;
    snap.running = current_ && current_->is_running();
    snap.pid = current_ ? current_->pid() : -1;
    snap.spawn_count = spawn_count_;
    snap.kill_count = kill_count_;
    snap.needs_history_replay = needs_history_replay_;
    return snap;
}

}  // namespace agent
}  // namespace agentlink
