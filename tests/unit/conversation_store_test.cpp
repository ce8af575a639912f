/**
 * conversation_store_test.cpp - YAML-backed conversation history
 */

#include "conversation/conversation_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "fake_agent.hpp"

using namespace agentlink::conversation;
using namespace agentlink::tests;

class ConversationStoreTest : public ::testing::Test {
protected:
    std::string directory() const { return dir_.file("conversations"); }

    TempDir dir_;
};

TEST_F(ConversationStoreTest, GeneratedIdIsFiveHexDigits) {
    for (int i = 0; i < 20; ++i) {
        std::string id = ConversationStore::generate_id();
        ASSERT_EQ(id.size(), 5u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos) << id;
    }

    ConversationStore store(directory());
    EXPECT_EQ(store.id().size(), 5u);
}

TEST_F(ConversationStoreTest, InitializeCreatesDirectory) {
    ConversationStore store(directory(), "abc12");
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;

    EXPECT_TRUE(std::filesystem::is_directory(directory()));
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.file_path(), (std::filesystem::path(directory()) / "abc12.yml").string());
}

TEST_F(ConversationStoreTest, AppendPersistsAndReloads) {
    nlohmann::json calls = nlohmann::json::array(
        {{{"name", "Bash"}, {"id", "toolu_1"}, {"input", {{"command", "ls -la"}, {"timeout", 30}}}}});
    {
        ConversationStore store(directory(), "c0ffe");
        std::string error;
        ASSERT_TRUE(store.initialize(error)) << error;
        store.add_user_message("list files");
        store.add_assistant_message("Here they are.", calls);
        EXPECT_TRUE(std::filesystem::exists(store.file_path()));
    }

    ConversationStore reloaded(directory(), "c0ffe");
    std::string error;
    ASSERT_TRUE(reloaded.initialize(error)) << error;

    auto entries = reloaded.snapshot();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].role, "user");
    EXPECT_EQ(entries[0].content, "list files");
    EXPECT_FALSE(entries[0].timestamp.empty());
    EXPECT_EQ(entries[1].role, "assistant");
    ASSERT_EQ(entries[1].tool_calls.size(), 1u);
    EXPECT_EQ(entries[1].tool_calls[0]["name"], "Bash");
    EXPECT_EQ(entries[1].tool_calls[0]["input"]["command"], "ls -la");
    EXPECT_EQ(entries[1].tool_calls[0]["input"]["timeout"], 30);
}

TEST_F(ConversationStoreTest, MultilineContentSurvivesReload) {
    const std::string content = "line one\nline two: with colon\n  indented";
    {
        ConversationStore store(directory(), "multi");
        std::string error;
        ASSERT_TRUE(store.initialize(error)) << error;
        store.add_assistant_message(content);
    }

    ConversationStore reloaded(directory(), "multi");
    std::string error;
    ASSERT_TRUE(reloaded.initialize(error)) << error;
    ASSERT_EQ(reloaded.size(), 1u);
    EXPECT_EQ(reloaded.snapshot()[0].content, content);
}

TEST_F(ConversationStoreTest, RecentReturnsTail) {
    ConversationStore store(directory(), "tail1");
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;
    for (int i = 0; i < 5; ++i) {
        store.add_user_message("m" + std::to_string(i));
    }

    auto last_two = store.recent(2);
    ASSERT_EQ(last_two.size(), 2u);
    EXPECT_EQ(last_two[0].content, "m3");
    EXPECT_EQ(last_two[1].content, "m4");

    EXPECT_EQ(store.recent(0).size(), 5u);
    EXPECT_EQ(store.recent(50).size(), 5u);
}

TEST_F(ConversationStoreTest, ReplayHistoryKeepsOrder) {
    ConversationStore store(directory(), "replay");
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;
    store.add_user_message("hi");
    store.add_assistant_message("hello");

    auto history = store.replay_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].role, "user");
    EXPECT_EQ(history[0].content, "hi");
    EXPECT_EQ(history[1].role, "assistant");
}

TEST_F(ConversationStoreTest, SummaryCountsRoles) {
    ConversationStore store(directory(), "count");
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;
    store.add_user_message("a");
    store.add_assistant_message("b");
    store.add_user_message("c");

    auto summary = store.summary();
    EXPECT_EQ(summary["conversation_id"], "count");
    EXPECT_EQ(summary["message_count"], 3);
    EXPECT_EQ(summary["user_messages"], 2);
    EXPECT_EQ(summary["assistant_messages"], 1);
    EXPECT_EQ(summary["file_path"], store.file_path());
}

TEST_F(ConversationStoreTest, CorruptFileStartsEmpty) {
    std::filesystem::create_directories(directory());
    {
        std::ofstream out(std::filesystem::path(directory()) / "broken.yml");
        out << "- role: user\n  content: [unclosed\n";
    }

    ConversationStore store(directory(), "broken");
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;
    EXPECT_EQ(store.size(), 0u);

    store.add_user_message("fresh start");
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(ConversationStoreTest, ClearPersists) {
    ConversationStore store(directory(), "wipe");
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;
    store.add_user_message("x");
    store.clear();

    ConversationStore reloaded(directory(), "wipe");
    ASSERT_TRUE(reloaded.initialize(error)) << error;
    EXPECT_EQ(reloaded.size(), 0u);
}

TEST_F(ConversationStoreTest, ConcurrentAppends) {
    ConversationStore store(directory(), "busy");
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 10; ++i) {
                store.add_user_message("t" + std::to_string(t) + "-" + std::to_string(i));
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store.size(), 40u);

    ConversationStore reloaded(directory(), "busy");
    ASSERT_TRUE(reloaded.initialize(error)) << error;
    EXPECT_EQ(reloaded.size(), 40u);
}
