#pragma once

#include <string>
#include <vector>

#include "agent_types.hpp"

namespace agentlink {
namespace agent {

// Interface for AgentClient to enable mocking
class IAgentClient {
public:
    virtual ~IAgentClient() = default;

    // Send one prompt and stream the response. Never throws for protocol/transport failures.
    virtual StreamOutcome execute_streaming(const std::string &prompt, const StreamCallbacks &callbacks,
                                            const std::vector<HistoryEntry> &history,
                                            const InterruptPredicate &is_interrupted,
                                            const CancellationToken *cancel) = 0;

    // Kill the agent process; the next execute_streaming restarts it and replays history
    virtual void interrupt_and_restart() = 0;

    // Join background work and shut the agent process down
    virtual void cleanup() = 0;
};

}  // namespace agent
}  // namespace agentlink
