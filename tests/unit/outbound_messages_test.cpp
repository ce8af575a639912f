/**
 * outbound_messages_test.cpp - client message builders and base64
 */

#include "conversation/outbound_messages.hpp"

#include <gtest/gtest.h>

using namespace agentlink::conversation;

TEST(OutboundMessagesTest, Base64KnownVectors) {
    EXPECT_EQ(messages::base64_encode(""), "");
    EXPECT_EQ(messages::base64_encode("f"), "Zg==");
    EXPECT_EQ(messages::base64_encode("fo"), "Zm8=");
    EXPECT_EQ(messages::base64_encode("foo"), "Zm9v");
    EXPECT_EQ(messages::base64_encode("foobar"), "Zm9vYmFy");
}

TEST(OutboundMessagesTest, Base64BinaryData) {
    std::string bytes("\x00\xff\x10\x80RIFF", 8);
    std::string encoded = messages::base64_encode(bytes);

    EXPECT_EQ(encoded.size() % 4, 0u);
    EXPECT_EQ(messages::base64_decode(encoded), bytes);
}

TEST(OutboundMessagesTest, ProcessingAndTextBlock) {
    auto thinking = messages::processing("thinking", "req-1");
    EXPECT_EQ(thinking["type"], "processing");
    EXPECT_EQ(thinking["status"], "thinking");
    EXPECT_EQ(thinking["request_id"], "req-1");

    auto text = messages::text_block("Hello", true, "req-1");
    EXPECT_EQ(text["type"], "text_block");
    EXPECT_EQ(text["content"], "Hello");
    EXPECT_TRUE(text["is_final"].get<bool>());
}

TEST(OutboundMessagesTest, ToolUseAndSummary) {
    nlohmann::json input = {{"command", "ls"}};

    auto use = messages::tool_use("Bash", input, "Using Bash", "req-2");
    EXPECT_EQ(use["type"], "tool_use");
    EXPECT_EQ(use["tool"], "Bash");
    EXPECT_EQ(use["input"], input);
    EXPECT_EQ(use["summary"], "Using Bash");

    auto update = messages::tool_summary("Bash", input, "Listing files", "req-2");
    EXPECT_EQ(update["type"], "tool_summary");
    EXPECT_EQ(update["summary"], "Listing files");
    EXPECT_EQ(update["request_id"], "req-2");
}

TEST(OutboundMessagesTest, AssistantMessageNormalizesToolCalls) {
    auto msg = messages::assistant_message("Done.", nullptr, "req-3");
    EXPECT_EQ(msg["type"], "assistant_message");
    EXPECT_TRUE(msg["tool_calls"].is_array());
    EXPECT_TRUE(msg["tool_calls"].empty());

    auto with_calls = messages::assistant_message("Done.", nlohmann::json::array({{{"name", "Read"}}}), "req-3");
    EXPECT_EQ(with_calls["tool_calls"].size(), 1u);
}

TEST(OutboundMessagesTest, AudioIsBase64Encoded) {
    auto msg = messages::audio("foo", "wav", 2, true, "req-4");
    EXPECT_EQ(msg["type"], "audio");
    EXPECT_EQ(msg["format"], "wav");
    EXPECT_EQ(msg["data"], "Zm9v");
    EXPECT_EQ(msg["chunk_index"], 2);
    EXPECT_TRUE(msg["is_final"].get<bool>());
}

TEST(OutboundMessagesTest, ErrorOmitsEmptyRequestId) {
    auto bare = messages::error("Unknown message type: ping");
    EXPECT_EQ(bare["type"], "error");
    EXPECT_FALSE(bare.contains("request_id"));

    auto scoped = messages::error("Failed to start Claude process: boom", "req-5");
    EXPECT_EQ(scoped["request_id"], "req-5");
}

TEST(OutboundMessagesTest, SessionInfoAndInterrupted) {
    auto info = messages::session_info("session-1", "/work", "c0ffe", "bypassPermissions");
    EXPECT_EQ(info["type"], "session_info");
    EXPECT_EQ(info["conversation_id"], "c0ffe");
    EXPECT_EQ(info["tool_profile"], "bypassPermissions");

    auto stop = messages::interrupted("user_stopped", "req-6");
    EXPECT_EQ(stop["type"], "interrupted");
    EXPECT_EQ(stop["reason"], "user_stopped");

    EXPECT_EQ(messages::config_updated(true), nlohmann::json({{"type", "config_updated"}, {"success", true}}));
}

TEST(OutboundMessagesTest, ToolInputProgressAndThinking) {
    auto progress = messages::tool_input_progress("1", "{\"pa", nlohmann::json::object(), "req-7");
    EXPECT_EQ(progress["type"], "tool_input_progress");
    EXPECT_EQ(progress["tool_id"], "1");
    EXPECT_EQ(progress["partial_json"], "{\"pa");

    auto thought = messages::thinking("Considering", "req-7");
    EXPECT_EQ(thought["type"], "thinking");
    EXPECT_EQ(thought["content"], "Considering");
}
