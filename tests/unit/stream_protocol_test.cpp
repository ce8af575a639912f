/**
 * stream_protocol_test.cpp - stream-json codec tests
 */

#include "agent/stream_protocol.hpp"

#include <gtest/gtest.h>

using namespace agentlink::agent;
using namespace agentlink::agent::protocol;

TEST(StreamProtocolTest, EncodeUserMessage) {
    std::string line = encode_message("user", "list files");

    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);

    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["type"], "user");
    EXPECT_EQ(j["message"]["role"], "user");
    ASSERT_EQ(j["message"]["content"].size(), 1u);
    EXPECT_EQ(j["message"]["content"][0]["type"], "text");
    EXPECT_EQ(j["message"]["content"][0]["text"], "list files");
}

TEST(StreamProtocolTest, EncodeEscapesNewlines) {
    std::string line = encode_message("assistant", "line one\nline two");

    EXPECT_EQ(line.find('\n'), line.size() - 1);
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["type"], "assistant");
    EXPECT_EQ(j["message"]["content"][0]["text"], "line one\nline two");
}

TEST(StreamProtocolTest, DecodeSystem) {
    auto event = decode_line(R"({"type":"system","subtype":"init","session_id":"x"})");
    ASSERT_TRUE(event.has_value());
    auto *system = std::get_if<SystemEvent>(&*event);
    ASSERT_NE(system, nullptr);
    EXPECT_EQ(system->subtype, "init");
}

TEST(StreamProtocolTest, DecodeAssistantKeepsBlockOrder) {
    auto event = decode_line(
        R"({"type":"assistant","message":{"content":[)"
        R"({"type":"text","text":"  Let me check.  "},)"
        R"({"type":"tool_use","id":"toolu_1","name":"Bash","input":{"command":"ls -la"}},)"
        R"({"type":"image","source":{}},)"
        R"({"type":"tool_use","id":"toolu_2","input":null}]}})");
    ASSERT_TRUE(event.has_value());
    auto *assistant = std::get_if<AssistantContentEvent>(&*event);
    ASSERT_NE(assistant, nullptr);
    ASSERT_EQ(assistant->blocks.size(), 3u);

    auto *text = std::get_if<TextBlock>(&assistant->blocks[0]);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->text, "Let me check.");

    auto *tool = std::get_if<ToolUseBlock>(&assistant->blocks[1]);
    ASSERT_NE(tool, nullptr);
    EXPECT_EQ(tool->id, "toolu_1");
    EXPECT_EQ(tool->name, "Bash");
    EXPECT_EQ(tool->input["command"], "ls -la");

    auto *unnamed = std::get_if<ToolUseBlock>(&assistant->blocks[2]);
    ASSERT_NE(unnamed, nullptr);
    EXPECT_EQ(unnamed->name, "unknown");
    EXPECT_TRUE(unnamed->input.is_object());
    EXPECT_TRUE(unnamed->input.empty());
}

TEST(StreamProtocolTest, DecodeAssistantWithoutContent) {
    auto event = decode_line(R"({"type":"assistant","message":{}})");
    ASSERT_TRUE(event.has_value());
    auto *assistant = std::get_if<AssistantContentEvent>(&*event);
    ASSERT_NE(assistant, nullptr);
    EXPECT_TRUE(assistant->blocks.empty());
}

TEST(StreamProtocolTest, DecodeInputJsonDelta) {
    auto event = decode_line(
        R"({"type":"content_block_delta","index":2,"delta":{"type":"input_json_delta","partial_json":"{\"file"}})");
    ASSERT_TRUE(event.has_value());
    auto *delta = std::get_if<ContentDeltaEvent>(&*event);
    ASSERT_NE(delta, nullptr);
    auto *input = std::get_if<InputJsonDelta>(&delta->delta);
    ASSERT_NE(input, nullptr);
    EXPECT_EQ(input->index, "2");
    EXPECT_EQ(input->partial_json, "{\"file");
}

TEST(StreamProtocolTest, DecodeThinkingDeltaInsideStreamEvent) {
    auto event = decode_line(
        R"({"type":"stream_event","event":{"type":"content_block_delta","index":0,)"
        R"("delta":{"type":"thinking_delta","thinking":"Hmm"}}})");
    ASSERT_TRUE(event.has_value());
    auto *delta = std::get_if<ContentDeltaEvent>(&*event);
    ASSERT_NE(delta, nullptr);
    auto *thinking = std::get_if<ThinkingDelta>(&delta->delta);
    ASSERT_NE(thinking, nullptr);
    EXPECT_EQ(thinking->text, "Hmm");
}

TEST(StreamProtocolTest, DecodeResult) {
    auto event = decode_line(R"({"type":"result","subtype":"success","result":"Done.","is_error":false})");
    ASSERT_TRUE(event.has_value());
    auto *result = std::get_if<ResultEvent>(&*event);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->text, "Done.");
    EXPECT_FALSE(result->is_error);

    auto error_event = decode_line(R"({"type":"result","result":"quota","is_error":true})");
    ASSERT_TRUE(error_event.has_value());
    EXPECT_TRUE(std::get<ResultEvent>(*error_event).is_error);
}

TEST(StreamProtocolTest, DecodeIsIdempotent) {
    const std::string assistant_line =
        R"({"type":"assistant","message":{"content":[)"
        R"({"type":"text","text":"Checking"},)"
        R"({"type":"tool_use","id":"toolu_9","name":"Grep","input":{"pattern":"TODO","path":"src"}}]}})";

    auto first = decode_line(assistant_line);
    auto second = decode_line(assistant_line);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(first->index(), second->index());

    const auto &a = std::get<AssistantContentEvent>(*first);
    const auto &b = std::get<AssistantContentEvent>(*second);
    ASSERT_EQ(a.blocks.size(), 2u);
    ASSERT_EQ(b.blocks.size(), 2u);
    EXPECT_EQ(std::get<TextBlock>(a.blocks[0]).text, std::get<TextBlock>(b.blocks[0]).text);
    const auto &tool_a = std::get<ToolUseBlock>(a.blocks[1]);
    const auto &tool_b = std::get<ToolUseBlock>(b.blocks[1]);
    EXPECT_EQ(tool_a.id, tool_b.id);
    EXPECT_EQ(tool_a.name, tool_b.name);
    EXPECT_EQ(tool_a.input, tool_b.input);

    const std::string delta_line =
        R"({"type":"stream_event","event":{"type":"content_block_delta","index":1,)"
        R"("delta":{"type":"input_json_delta","partial_json":"{"pattern":"TO"}}})";

    auto first_delta = decode_line(delta_line);
    auto second_delta = decode_line(delta_line);
    ASSERT_TRUE(first_delta.has_value());
    ASSERT_TRUE(second_delta.has_value());
    const auto &input_a = std::get<InputJsonDelta>(std::get<ContentDeltaEvent>(*first_delta).delta);
    const auto &input_b = std::get<InputJsonDelta>(std::get<ContentDeltaEvent>(*second_delta).delta);
    EXPECT_EQ(input_a.index, "1");
    EXPECT_EQ(input_a.index, input_b.index);
    EXPECT_EQ(input_a.partial_json, input_b.partial_json);
}

TEST(StreamProtocolTest, MalformedAndUnknownLinesAreSkipped) {
    EXPECT_FALSE(decode_line("").has_value());
    EXPECT_FALSE(decode_line("not json").has_value());
    EXPECT_FALSE(decode_line(R"({"type":"assistant")").has_value());
    EXPECT_FALSE(decode_line("[1,2,3]").has_value());
    EXPECT_FALSE(decode_line(R"({"type":"user","message":{}})").has_value());
    EXPECT_FALSE(decode_line(R"({"type":"content_block_delta","delta":{"type":"text_delta"}})").has_value());
    EXPECT_FALSE(decode_line(R"({"type":"stream_event"})").has_value());
}

TEST(StreamProtocolTest, PartialToolInput) {
    EXPECT_EQ(parse_partial_tool_input(R"({"path": "/tmp")"), nlohmann::json({{"path", "/tmp"}}));
    EXPECT_EQ(parse_partial_tool_input(R"({"path": "/tm)"), nlohmann::json::object());
    EXPECT_EQ(parse_partial_tool_input(""), nlohmann::json::object());
}

TEST(StreamProtocolTest, ToolCallsToJson) {
    std::vector<ToolCallRecord> calls = {{"Read", "t1", {{"file_path", "a.txt"}}}, {"Bash", "t2", {}}};
    auto j = tool_calls_to_json(calls);

    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["name"], "Read");
    EXPECT_EQ(j[0]["id"], "t1");
    EXPECT_EQ(j[0]["input"]["file_path"], "a.txt");
    EXPECT_EQ(j[1]["name"], "Bash");
}
