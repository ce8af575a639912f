/**
 * agent_process_test.cpp - AgentProcess unit tests
 *
 * Tests:
 * - Spawn with missing executable (error path)
 * - Spawn and line round trip through a real child
 * - Write deadline against a child that never reads
 * - is_running() after the child exits on its own
 * - Graceful terminate and immediate kill
 * - Double shutdown safety
 */

#include "agent/agent_process.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <thread>

#include "fake_agent.hpp"

using namespace agentlink::agent;
using namespace agentlink::tests;

class AgentProcessTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(AgentProcessTest, MissingExecutable) {
    AgentProcess process("test", dir_.file("no-such-binary"));

    EXPECT_FALSE(process.spawn());
    EXPECT_NE(process.last_error().find("Executable not found"), std::string::npos);
    EXPECT_FALSE(process.is_running());
}

TEST_F(AgentProcessTest, ResolveExecutableUsesPath) {
    EXPECT_FALSE(resolve_executable("sh").empty());
    EXPECT_TRUE(resolve_executable("definitely-not-a-real-command-xyz").empty());
    EXPECT_TRUE(resolve_executable("").empty());
}

TEST_F(AgentProcessTest, EchoRoundTrip) {
    std::string script = write_script(dir_, "echo.sh", "while IFS= read -r line; do echo \"got:$line\"; done\n");
    AgentProcess process("test", script);

    ASSERT_TRUE(process.spawn()) << process.last_error();
    EXPECT_TRUE(process.is_running());
    EXPECT_GT(process.pid(), 0);

    ASSERT_TRUE(process.client().write_line("ping", 1000));
    std::string line;
    ASSERT_EQ(process.client().read_line(line, 2000), ReadStatus::LINE);
    EXPECT_EQ(line, "got:ping");

    process.terminate(1000);
    EXPECT_FALSE(process.is_running());
}

TEST_F(AgentProcessTest, LargeWriteToIdleReaderTimesOut) {
    AgentProcess process("test", write_script(dir_, "idle.sh", "exec sleep 30\n"));
    ASSERT_TRUE(process.spawn()) << process.last_error();

    // Several pipe buffers' worth: a blocking write would hang here until the reader dies
    std::string line(300 * 1024, 'x');
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(process.client().write_line(line, 300));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(process.client().last_error(), "Timeout writing line");
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 250);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
    EXPECT_TRUE(process.is_running());

    process.kill(1000);
}

TEST_F(AgentProcessTest, ArgumentsAndWorkingDirectory) {
    std::string work = dir_.file("work");
    std::filesystem::create_directories(work);
    std::string script = write_script(dir_, "args.sh", "echo \"$1|$2|$(pwd -P)\"\n");
    AgentProcess process("test", script, {"--flag", "two words"}, work);

    ASSERT_TRUE(process.spawn()) << process.last_error();
    std::string line;
    ASSERT_EQ(process.client().read_line(line, 2000), ReadStatus::LINE);
    EXPECT_EQ(line, "--flag|two words|" + std::filesystem::canonical(work).string());
}

TEST_F(AgentProcessTest, ExitIsObserved) {
    std::string script = write_script(dir_, "exit3.sh", "exit 3\n");
    AgentProcess process("test", script);

    ASSERT_TRUE(process.spawn());
    EXPECT_TRUE(wait_until([&] { return !process.is_running(); }, 2000));
    ASSERT_TRUE(process.exit_status().has_value());
    EXPECT_EQ(*process.exit_status(), 3);

    std::string line;
    EXPECT_EQ(process.client().read_line(line, 500), ReadStatus::END_OF_STREAM);
}

TEST_F(AgentProcessTest, GracefulTerminateClosesStdin) {
    // Exits 0 on EOF
    std::string script = write_script(dir_, "eof.sh", "cat > /dev/null\nexit 0\n");
    AgentProcess process("test", script);

    ASSERT_TRUE(process.spawn());
    process.terminate(2000);

    EXPECT_FALSE(process.is_running());
    ASSERT_TRUE(process.exit_status().has_value());
}

TEST_F(AgentProcessTest, KillIsImmediate) {
    std::string script = write_script(dir_, "stubborn.sh", "trap '' TERM\nwhile true; do sleep 0.05; done\n");
    AgentProcess process("test", script);

    ASSERT_TRUE(process.spawn());
    auto start = std::chrono::steady_clock::now();
    process.kill(1000);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(process.is_running());
    ASSERT_TRUE(process.exit_status().has_value());
    EXPECT_EQ(*process.exit_status(), 128 + 9);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 1000);
}

TEST_F(AgentProcessTest, ReaderSeesEofAfterKill) {
    std::string script = write_script(dir_, "silent.sh", "exec sleep 30\n");
    AgentProcess process("test", script);
    ASSERT_TRUE(process.spawn());

    std::thread killer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        process.kill(1000);
    });

    std::string line;
    ReadStatus status = ReadStatus::TIMEOUT;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (status == ReadStatus::TIMEOUT && std::chrono::steady_clock::now() < deadline) {
        status = process.client().read_line(line, 50);
    }
    killer.join();

    EXPECT_EQ(status, ReadStatus::END_OF_STREAM);
}

TEST_F(AgentProcessTest, DoubleShutdownIsSafe) {
    std::string script = write_script(dir_, "eof.sh", "cat > /dev/null\n");
    AgentProcess process("test", script);

    ASSERT_TRUE(process.spawn());
    process.terminate(1000);
    process.terminate(1000);
    process.kill(100);

    EXPECT_FALSE(process.is_running());
}
