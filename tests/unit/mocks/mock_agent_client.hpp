#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "agent/i_agent_client.hpp"

namespace agentlink::tests {

using namespace agentlink;
using namespace testing;

class MockAgentClient : public agent::IAgentClient {
public:
    MOCK_METHOD(agent::StreamOutcome, execute_streaming,
                (const std::string &, const agent::StreamCallbacks &, const std::vector<agent::HistoryEntry> &,
                 const agent::InterruptPredicate &, const agent::CancellationToken *),
                (override));
    MOCK_METHOD(void, interrupt_and_restart, (), (override));
    MOCK_METHOD(void, cleanup, (), (override));
};

}  // namespace agentlink::tests
