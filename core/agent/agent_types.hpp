#pragma once

#include <atomic>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentlink {
namespace agent {

// Failure strings surfaced in StreamOutcome::response
constexpr const char *kInterruptedMessage = "Request interrupted by user";
constexpr const char *kCancelledMessage = "Request cancelled by user";
constexpr const char *kNoResponseMessage = "No response received from Claude process";

// One prior conversation turn, replayed into a freshly started agent
struct HistoryEntry {
    std::string role;  // "user" or "assistant"
    std::string content;
};

// A tool invocation observed in the stream. Appended once, never mutated.
struct ToolCallRecord {
    std::string name;
    std::string id;
    nlohmann::json input = nlohmann::json::object();
};

/**
 * @brief Named, optional callbacks fired by AgentClient::execute_streaming
 *
 * All callbacks run on the thread that called execute_streaming, in stream order,
 * except on_tool_summary_update which runs on a background summary thread.
 */
struct StreamCallbacks {
    // Immediate placeholder for a tool call: (name, input, "Using <name>")
    std::function<void(const std::string &, const nlohmann::json &, const std::string &)> on_tool_use;

    // Better summary for an earlier tool call: (name, input, summary). Unordered w.r.t. the main stream.
    std::function<void(const std::string &, const nlohmann::json &, const std::string &)> on_tool_summary_update;

    // Assistant text: (text, is_final). is_final=true re-announces a block that turned out to be the result.
    std::function<void(const std::string &, bool)> on_text_block;

    // Tool input being built: (tool_id, partial_json, best_effort_input). Advisory only.
    std::function<void(const std::string &, const std::string &, const nlohmann::json &)> on_tool_input_progress;

    // Reasoning text
    std::function<void(const std::string &)> on_thinking_block;
};

struct StreamOutcome {
    bool success = false;
    std::string response;
    std::vector<ToolCallRecord> tool_calls;
    bool already_sent_as_text_block = false;
};

// Polled cooperatively by the read loop and by background summary jobs
using InterruptPredicate = std::function<bool()>;

// Task-cancellation signal for a request worker. Independent of the interrupt predicate.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

nlohmann::json tool_calls_to_json(const std::vector<ToolCallRecord> &tool_calls);

}  // namespace agent
}  // namespace agentlink
