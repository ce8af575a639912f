#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "agent_config.hpp"
#include "agent_supervisor.hpp"
#include "i_agent_client.hpp"
#include "summarizer.hpp"

namespace agentlink {
namespace agent {

/**
 * @brief Streaming client for a persistent agent process speaking stream-json
 *
 * One exchange at a time: execute_streaming holds the exchange lock from the first write
 * until the read loop exits, so prompts and history replays never interleave on stdin and
 * two callers never consume each other's output.
 *
 * Write phase: replay history into a fresh process (if flagged), then the prompt. A failed
 * write is treated as a crash: the handle is discarded, a new process started, history
 * replayed and the write retried once. A request stopped during the write phase is never
 * retried.
 *
 * Read phase: one line per iteration, dispatched synchronously before the next read.
 * The interrupt predicate and the cancellation token are checked before and after every
 * read, after decoding, and before every callback.
 *
 * Tool summaries run on tracked background threads and re-check the predicate before
 * invoking on_tool_summary_update.
 */
class AgentClient : public IAgentClient {
public:
    explicit AgentClient(const AgentConfig &config, std::shared_ptr<ISummarizer> summarizer = nullptr);
    ~AgentClient() override;

    AgentClient(const AgentClient &) = delete;
    AgentClient &operator=(const AgentClient &) = delete;

    StreamOutcome execute_streaming(const std::string &prompt, const StreamCallbacks &callbacks,
                                    const std::vector<HistoryEntry> &history,
                                    const InterruptPredicate &is_interrupted,
                                    const CancellationToken *cancel = nullptr) override;

    void interrupt_and_restart() override;
    void cleanup() override;

    // Join all outstanding summary jobs
    void wait_for_background_tasks();
    size_t pending_background_tasks();

    AgentSupervisor &supervisor() { return supervisor_; }

private:
    struct SummaryJob {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    AgentConfig config_;
    AgentSupervisor supervisor_;
    std::shared_ptr<ISummarizer> summarizer_;

    std::mutex exchange_mutex_;

    std::mutex jobs_mutex_;
    std::vector<SummaryJob> jobs_;

    // Failure text when the exchange must stop, nullptr otherwise
    using StopCheck = std::function<const char *()>;

    // Write phase with one crash-recovery retry. Returns the handle the prompt went to, or
    // nullptr with `error` set (to the stop reason if the request was stopped mid-write).
    std::shared_ptr<AgentProcess> send_prompt(const std::string &prompt, const std::vector<HistoryEntry> &history,
                                              const StopCheck &stop_reason, std::string &error);
    bool write_exchange(const std::shared_ptr<AgentProcess> &handle, const std::string &prompt,
                        const std::vector<HistoryEntry> &history, const StopCheck &stop_reason,
                        std::string &error);

    // Early exit: the process may still hold output for this request, so it cannot serve the next one
    void abandon(const std::shared_ptr<AgentProcess> &handle);

    void start_summary_job(const std::string &tool_name, const nlohmann::json &tool_input,
                           const StreamCallbacks &callbacks, const InterruptPredicate &is_interrupted);
    void reap_finished_jobs();
};

}  // namespace agent
}  // namespace agentlink
