#include "agent_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include "logging/logger.hpp"

namespace agentlink {
namespace agent {

namespace {
// A dead agent must surface as EPIPE on write, not terminate the whole server
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

bool is_executable_file(const std::string &path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}
}  // namespace

std::string resolve_executable(const std::string &command) {
    if (command.empty()) {
        return "";
    }
    if (command.find('/') != std::string::npos) {
        return is_executable_file(command) ? std::filesystem::absolute(command).string() : "";
    }

    const char *path_env = std::getenv("PATH");
    std::stringstream dirs(path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + command;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return "";
}

AgentProcess::AgentProcess(const std::string &name, const std::string &command, const std::vector<std::string> &args,
                           const std::string &working_directory)
    : name_(name),
      command_(command),
      args_(args),
      working_directory_(working_directory),
      pid_(-1),
      stdin_write_fd_(-1),
      stdout_read_fd_(-1) {}

AgentProcess::~AgentProcess() {
    terminate(500);
    client_.close_stdin();
    client_.close_stdout();
}

bool AgentProcess::spawn() {
    LOG_INFO("[" << name_ << "] Spawning: " << command_);
    ignore_sigpipe_once();

    std::string abs_path = resolve_executable(command_);
    if (abs_path.empty()) {
        error_ = "Executable not found: " + command_;
        LOG_ERROR("[" << name_ << "] " << error_);
        return false;
    }

    if (!working_directory_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(working_directory_, ec);
        if (ec) {
            error_ = "Cannot create working directory " + working_directory_ + ": " + ec.message();
            LOG_ERROR("[" << name_ << "] " << error_);
            return false;
        }
    }

    // Close-on-exec so sibling children (TTS, a replacement agent) never inherit these ends
    int stdin_pipe[2];
    int stdout_pipe[2];
    if (pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdin pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return false;
    }

    // argv is built before fork: only async-signal-safe calls happen in the child
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(abs_path.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char *cwd = working_directory_.empty() ? nullptr : working_directory_.c_str();

    std::lock_guard<std::mutex> lock(pid_mutex_);
    pid_t child = fork();
    if (child < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    if (child == 0) {
        // dup2 clears close-on-exec on the targets
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        signal(SIGPIPE, SIG_DFL);
        if (cwd != nullptr && chdir(cwd) != 0) {
            _exit(126);
        }
        execv(argv[0], argv.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    // Non-blocking stdin: a write larger than PIPE_BUF must not outlive its deadline
    int flags = fcntl(stdin_pipe[1], F_GETFL);
    if (flags < 0 || fcntl(stdin_pipe[1], F_SETFL, flags | O_NONBLOCK) < 0) {
        LOG_WARN("[" << name_ << "] Could not make stdin non-blocking: " << strerror(errno));
    }

    pid_ = child;
    exit_status_.reset();
    stdin_write_fd_ = stdin_pipe[1];
    stdout_read_fd_ = stdout_pipe[0];
    client_.set_handles(stdin_write_fd_, stdout_read_fd_);
    error_.clear();

    LOG_INFO("[" << name_ << "] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

bool AgentProcess::reap_locked(bool block) {
    if (pid_ <= 0) {
        return true;
    }
    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, block ? 0 : WNOHANG);
        if (result == pid_) {
            if (WIFEXITED(status)) {
                exit_status_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_status_ = 128 + WTERMSIG(status);
            }
            pid_ = -1;
            return true;
        }
        if (result == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == ECHILD) {
            // Reaped elsewhere
            pid_ = -1;
            return true;
        }
        return false;
    }
}

void AgentProcess::signal_locked(int sig) {
    if (pid_ > 0) {
        ::kill(pid_, sig);
    }
}

bool AgentProcess::is_running() {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    if (pid_ <= 0) {
        return false;
    }
    return !reap_locked(false);
}

pid_t AgentProcess::pid() const {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    return pid_;
}

std::optional<int> AgentProcess::exit_status() const {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    return exit_status_;
}

void AgentProcess::terminate(int grace_ms) {
    if (!is_running()) {
        return;
    }

    LOG_INFO("[" << name_ << "] Initiating shutdown");

    // 1. Send EOF, 2. ask politely
    client_.close_stdin();
    {
        std::lock_guard<std::mutex> lock(pid_mutex_);
        signal_locked(SIGTERM);
    }

    if (wait_for_exit(grace_ms)) {
        LOG_INFO("[" << name_ << "] Clean shutdown");
        return;
    }

    // 3. Forced kill
    LOG_WARN("[" << name_ << "] Timeout - forcing termination");
    {
        std::lock_guard<std::mutex> lock(pid_mutex_);
        signal_locked(SIGKILL);
    }
    wait_for_exit(500);
}

void AgentProcess::kill(int wait_ms) {
    {
        std::lock_guard<std::mutex> lock(pid_mutex_);
        if (pid_ <= 0) {
            return;
        }
        LOG_INFO("[" << name_ << "] Killing PID " << pid_);
        signal_locked(SIGKILL);
    }
    if (!wait_for_exit(wait_ms)) {
        LOG_WARN("[" << name_ << "] Process did not exit within " << wait_ms << "ms after SIGKILL");
    }
}

bool AgentProcess::wait_for_exit(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        {
            std::lock_guard<std::mutex> lock(pid_mutex_);
            if (reap_locked(false)) {
                return true;
            }
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace agent
}  // namespace agentlink
