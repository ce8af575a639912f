#pragma once

/**
 * @file stream_protocol.hpp
 * @brief Stream-json wire codec for the agent process
 *
 * Both directions carry one JSON object per line.
 *
 * Outbound envelope:
 *   {"type":"user","message":{"role":"user","content":[{"type":"text","text":"..."}]}}
 *
 * Inbound discriminants (the "type" field):
 *   system               -> SystemEvent
 *   assistant            -> AssistantContentEvent (message.content[] of text / tool_use items)
 *   content_block_delta  -> ContentDeltaEvent (delta.type input_json_delta / thinking_delta)
 *   result               -> ResultEvent (result string)
 *   stream_event         -> unwrapped, its "event" member is decoded instead
 *
 * Everything here is pure: no I/O, no state.
 */

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "agent_types.hpp"

namespace agentlink {
namespace agent {
namespace protocol {

struct SystemEvent {
    std::string subtype;
};

struct TextBlock {
    std::string text;
};

struct ToolUseBlock {
    std::string id;
    std::string name;
    nlohmann::json input = nlohmann::json::object();
};

using ContentBlock = std::variant<TextBlock, ToolUseBlock>;

struct AssistantContentEvent {
    std::vector<ContentBlock> blocks;  // Stream order preserved
};

struct InputJsonDelta {
    std::string index;  // Content block index, stringified
    std::string partial_json;
};

struct ThinkingDelta {
    std::string text;
};

struct ContentDeltaEvent {
    std::variant<InputJsonDelta, ThinkingDelta> delta;
};

struct ResultEvent {
    std::string text;
    bool is_error = false;
};

using StreamEvent = std::variant<SystemEvent, AssistantContentEvent, ContentDeltaEvent, ResultEvent>;

// Encode a role+text pair as one newline-terminated line
std::string encode_message(const std::string &role, const std::string &text);

// Decode one line. std::nullopt for malformed JSON and unrecognized types. Never throws.
std::optional<StreamEvent> decode_line(std::string_view line);

// Decode an already-parsed object (used for stream_event unwrapping)
std::optional<StreamEvent> decode_event(const nlohmann::json &event);

// Best-effort view of an incomplete tool input: parse(partial + "}"), {} on failure
nlohmann::json parse_partial_tool_input(const std::string &partial_json);

}  // namespace protocol
}  // namespace agent
}  // namespace agentlink
