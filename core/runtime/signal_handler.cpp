#include "signal_handler.hpp"

#include <signal.h>

#include <cstring>

namespace agentlink {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<int> SignalHandler::last_signal_{0};

void SignalHandler::install() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

int SignalHandler::last_signal() { return last_signal_.load(); }

void SignalHandler::request_shutdown() { shutdown_requested_.store(true); }

void SignalHandler::reset() {
    shutdown_requested_.store(false);
    last_signal_.store(0);
}

void SignalHandler::handle_signal(int signal) {
    // Lock-free atomics only
    last_signal_.store(signal);
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace agentlink
