#include "stream_protocol.hpp"

namespace agentlink {
namespace agent {

nlohmann::json tool_calls_to_json(const std::vector<ToolCallRecord> &tool_calls) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &call : tool_calls) {
        out.push_back({{"name", call.name}, {"id", call.id}, {"input", call.input}});
    }
    return out;
}

namespace protocol {

namespace {

std::string string_field(const nlohmann::json &obj, const char *key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::optional<StreamEvent> decode_assistant(const nlohmann::json &event) {
    AssistantContentEvent out;

    auto message = event.find("message");
    if (message == event.end() || !message->is_object()) {
        return out;
    }
    auto content = message->find("content");
    if (content == message->end() || !content->is_array()) {
        return out;
    }

    for (const auto &item : *content) {
        if (!item.is_object()) {
            continue;
        }
        std::string item_type = string_field(item, "type");
        if (item_type == "text") {
            out.blocks.emplace_back(TextBlock{trim(string_field(item, "text"))});
        } else if (item_type == "tool_use") {
            ToolUseBlock block;
            block.id = string_field(item, "id");
            block.name = string_field(item, "name");
            if (block.name.empty()) {
                block.name = "unknown";
            }
            auto input = item.find("input");
            if (input != item.end() && !input->is_null()) {
                block.input = *input;
            }
            out.blocks.emplace_back(std::move(block));
        }
    }
    return out;
}

std::optional<StreamEvent> decode_delta(const nlohmann::json &event) {
    auto delta = event.find("delta");
    if (delta == event.end() || !delta->is_object()) {
        return std::nullopt;
    }

    std::string delta_type = string_field(*delta, "type");
    if (delta_type == "input_json_delta") {
        InputJsonDelta out;
        out.partial_json = string_field(*delta, "partial_json");
        auto index = event.find("index");
        if (index == event.end()) {
            out.index = "unknown";
        } else if (index->is_string()) {
            out.index = index->get<std::string>();
        } else {
            out.index = index->dump();
        }
        return ContentDeltaEvent{out};
    }
    if (delta_type == "thinking_delta") {
        std::string text = string_field(*delta, "thinking");
        if (text.empty()) {
            text = string_field(*delta, "text");
        }
        return ContentDeltaEvent{ThinkingDelta{text}};
    }
    return std::nullopt;
}

}  // namespace

std::string encode_message(const std::string &role, const std::string &text) {
    nlohmann::json message = {
        {"type", role == "assistant" ? "assistant" : "user"},
        {"message",
         {{"role", role.empty() ? "user" : role}, {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}}}};
    // Replace invalid UTF-8 instead of throwing; the agent only accepts valid JSON
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::optional<StreamEvent> decode_event(const nlohmann::json &event) {
    if (!event.is_object()) {
        return std::nullopt;
    }

    std::string type = string_field(event, "type");
    if (type == "system") {
        return SystemEvent{string_field(event, "subtype")};
    }
    if (type == "assistant") {
        return decode_assistant(event);
    }
    if (type == "content_block_delta") {
        return decode_delta(event);
    }
    if (type == "result") {
        ResultEvent out;
        out.text = string_field(event, "result");
        auto is_error = event.find("is_error");
        out.is_error = is_error != event.end() && is_error->is_boolean() && is_error->get<bool>();
        return out;
    }
    if (type == "stream_event") {
        auto inner = event.find("event");
        if (inner == event.end()) {
            return std::nullopt;
        }
        return decode_event(*inner);
    }
    return std::nullopt;
}

std::optional<StreamEvent> decode_line(std::string_view line) {
    nlohmann::json event = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (event.is_discarded()) {
        return std::nullopt;
    }
    return decode_event(event);
}

nlohmann::json parse_partial_tool_input(const std::string &partial_json) {
    std::string candidate = partial_json + "}";
    nlohmann::json parsed = nlohmann::json::parse(candidate, nullptr, false);
    if (parsed.is_discarded()) {
        return nlohmann::json::object();
    }
    return parsed;
}

}  // namespace protocol
}  // namespace agent
}  // namespace agentlink
