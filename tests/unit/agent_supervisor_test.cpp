/**
 * agent_supervisor_test.cpp - AgentSupervisor lifecycle tests
 *
 * Tests:
 * - Startup argument layout
 * - Process reuse and restart after exit
 * - Replay flag on spawn, kill, and mark_history_replayed
 * - discard() leaves a newer handle alone
 */

#include "agent/agent_supervisor.hpp"

#include <gtest/gtest.h>

#include <algorithm>

#include "fake_agent.hpp"

using namespace agentlink::agent;
using namespace agentlink::tests;

class AgentSupervisorTest : public ::testing::Test {
protected:
    AgentConfig make_config(const std::string &body) {
        AgentConfig config;
        config.command = write_script(dir_, "agent.sh", body);
        config.startup_settle_ms = 0;
        config.shutdown_timeout_ms = 500;
        config.kill_timeout_ms = 500;
        return config;
    }

    TempDir dir_;
};

TEST_F(AgentSupervisorTest, CommandArgsLayout) {
    AgentConfig config;
    config.allowed_tools = {"Read", "Grep"};
    config.permission_mode = "acceptEdits";
    config.system_prompt = "Be brief.";
    config.args = {"--model", "sonnet"};
    AgentSupervisor supervisor(config);

    auto args = supervisor.build_command_args();
    std::vector<std::string> expected = {"-p",
                                         "--input-format",
                                         "stream-json",
                                         "--output-format",
                                         "stream-json",
                                         "--verbose",
                                         "--allowedTools",
                                         "Read Grep",
                                         "--permission-mode",
                                         "acceptEdits",
                                         "--system-prompt",
                                         "Be brief.",
                                         "--model",
                                         "sonnet"};
    EXPECT_EQ(args, expected);
}

TEST_F(AgentSupervisorTest, DefaultPromptForbidsMarkdown) {
    AgentConfig config;
    AgentSupervisor supervisor(config);

    auto args = supervisor.build_command_args();
    auto it = std::find(args.begin(), args.end(), "--system-prompt");
    ASSERT_NE(it, args.end());
    ASSERT_NE(it + 1, args.end());
    EXPECT_NE((it + 1)->find("NO MARKDOWN"), std::string::npos);
}

TEST_F(AgentSupervisorTest, ReusesLiveProcess) {
    AgentSupervisor supervisor(make_config("cat > /dev/null\n"));

    std::string error;
    auto first = supervisor.ensure_started(error);
    ASSERT_NE(first, nullptr) << error;
    auto second = supervisor.ensure_started(error);

    EXPECT_EQ(first, second);
    EXPECT_EQ(supervisor.snapshot().spawn_count, 1u);
    EXPECT_TRUE(supervisor.snapshot().running);
    EXPECT_EQ(supervisor.snapshot().pid, first->pid());
}

TEST_F(AgentSupervisorTest, RestartsAfterExit) {
    AgentSupervisor supervisor(make_config("exit 0\n"));

    std::string error;
    auto first = supervisor.ensure_started(error);
    ASSERT_NE(first, nullptr) << error;
    ASSERT_TRUE(wait_until([&] { return !first->is_running(); }, 2000));

    auto second = supervisor.ensure_started(error);
    ASSERT_NE(second, nullptr) << error;
    EXPECT_NE(first, second);
    EXPECT_EQ(supervisor.snapshot().spawn_count, 2u);
}

TEST_F(AgentSupervisorTest, SpawnFailureReportsError) {
    AgentConfig config;
    config.command = dir_.file("missing-agent");
    AgentSupervisor supervisor(config);

    std::string error;
    EXPECT_EQ(supervisor.ensure_started(error), nullptr);
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(supervisor.snapshot().spawn_count, 0u);
}

TEST_F(AgentSupervisorTest, ReplayFlagFollowsHandle) {
    AgentSupervisor supervisor(make_config("cat > /dev/null\n"));
    EXPECT_TRUE(supervisor.needs_history_replay());

    std::string error;
    auto handle = supervisor.ensure_started(error);
    ASSERT_NE(handle, nullptr) << error;
    EXPECT_TRUE(supervisor.needs_history_replay());

    supervisor.mark_history_replayed(handle);
    EXPECT_FALSE(supervisor.needs_history_replay());

    supervisor.kill_and_invalidate();
    EXPECT_TRUE(supervisor.needs_history_replay());
    EXPECT_FALSE(supervisor.is_current(handle));
    EXPECT_FALSE(handle->is_running());

    // A stale handle cannot clear the flag for its successor
    supervisor.mark_history_replayed(handle);
    EXPECT_TRUE(supervisor.needs_history_replay());
}

TEST_F(AgentSupervisorTest, KillCountsOnlyLiveHandles) {
    AgentSupervisor supervisor(make_config("cat > /dev/null\n"));

    supervisor.kill_and_invalidate();
    EXPECT_EQ(supervisor.snapshot().kill_count, 0u);

    std::string error;
    ASSERT_NE(supervisor.ensure_started(error), nullptr) << error;
    supervisor.kill_and_invalidate();

    auto snap = supervisor.snapshot();
    EXPECT_EQ(snap.kill_count, 1u);
    EXPECT_FALSE(snap.running);
    EXPECT_EQ(snap.pid, -1);
}

TEST_F(AgentSupervisorTest, DiscardIgnoresStaleHandle) {
    AgentSupervisor supervisor(make_config("cat > /dev/null\n"));

    std::string error;
    auto old_handle = supervisor.ensure_started(error);
    ASSERT_NE(old_handle, nullptr) << error;
    supervisor.kill_and_invalidate();

    auto fresh = supervisor.ensure_started(error);
    ASSERT_NE(fresh, nullptr) << error;
    supervisor.mark_history_replayed(fresh);

    supervisor.discard(old_handle);
    EXPECT_TRUE(supervisor.is_current(fresh));
    EXPECT_TRUE(fresh->is_running());
    EXPECT_FALSE(supervisor.needs_history_replay());

    supervisor.discard(fresh);
    EXPECT_FALSE(supervisor.is_current(fresh));
    EXPECT_TRUE(supervisor.needs_history_replay());
}

TEST_F(AgentSupervisorTest, ShutdownTerminatesProcess) {
    AgentSupervisor supervisor(make_config("cat > /dev/null\n"));

    std::string error;
    auto handle = supervisor.ensure_started(error);
    ASSERT_NE(handle, nullptr) << error;

    supervisor.shutdown();
    EXPECT_FALSE(handle->is_running());
    EXPECT_FALSE(supervisor.snapshot().running);

    supervisor.shutdown();
}
