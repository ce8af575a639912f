#pragma once

#include <atomic>

namespace agentlink {
namespace runtime {

// Turns SIGINT/SIGTERM into a flag polled by the runtime main loop.
// The first signal requests a graceful stop; the agent and TTS children are torn down by
// Runtime::shutdown(), not from the handler.
class SignalHandler {
public:
    static void install();

    static bool is_shutdown_requested();

    // Signal number that requested shutdown, 0 if none (or requested programmatically)
    static int last_signal();

    // Request shutdown without a signal (tests, programmatic stop)
    static void request_shutdown();
    static void reset();

private:
    static void handle_signal(int signal);

    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> last_signal_;
};

}  // namespace runtime
}  // namespace agentlink
