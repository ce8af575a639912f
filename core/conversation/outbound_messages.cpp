#include "outbound_messages.hpp"

#include <vector>

namespace agentlink {
namespace conversation {
namespace messages {

namespace {
const std::string base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";
}  // namespace

std::string base64_encode(const std::string &bytes) {
    std::string encoded;
    encoded.reserve(((bytes.size() + 2) / 3) * 4);
    int val = 0;
    int bits = -6;

    for (unsigned char c : bytes) {
        val = (val << 8) + c;
        bits += 8;
        while (bits >= 0) {
            encoded.push_back(base64_chars[(val >> bits) & 0x3F]);
            bits -= 6;
        }
    }
    if (bits > -6) {
        encoded.push_back(base64_chars[((val << 8) >> (bits + 8)) & 0x3F]);
    }
    while ((encoded.size() % 4) != 0) {
        encoded.push_back('=');
    }
    return encoded;
}

std::string base64_decode(const std::string &encoded) {
    std::string decoded;
    std::vector<int> T(256, -1);
    for (int i = 0; i < 64; i++) {
        T[static_cast<unsigned char>(base64_chars[i])] = i;
    }

    int val = 0;
    int bits = -8;
    for (unsigned char c : encoded) {
        if (T[c] == -1) {
            break;
        }
        val = (val << 6) + T[c];
        bits += 6;
        if (bits >= 0) {
            decoded.push_back(char((val >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return decoded;
}

nlohmann::json session_info(const std::string &session_id, const std::string &working_dir,
                            const std::string &conversation_id, const std::string &tool_profile) {
    return {{"type", "session_info"},
            {"session_id", session_id},
            {"working_dir", working_dir},
            {"conversation_id", conversation_id},
            {"tool_profile", tool_profile}};
}

nlohmann::json processing(const std::string &status, const std::string &request_id) {
    return {{"type", "processing"}, {"status", status}, {"request_id", request_id}};
}

nlohmann::json tool_use(const std::string &tool, const nlohmann::json &input, const std::string &summary,
                        const std::string &request_id) {
    return {{"type", "tool_use"}, {"tool", tool}, {"input", input}, {"summary", summary}, {"request_id", request_id}};
}

nlohmann::json tool_summary(const std::string &tool, const nlohmann::json &input, const std::string &summary,
                            const std::string &request_id) {
    return {
        {"type", "tool_summary"}, {"tool", tool}, {"input", input}, {"summary", summary}, {"request_id", request_id}};
}

nlohmann::json text_block(const std::string &content, bool is_final, const std::string &request_id) {
    return {{"type", "text_block"}, {"content", content}, {"is_final", is_final}, {"request_id", request_id}};
}

nlohmann::json tool_input_progress(const std::string &tool_id, const std::string &partial_json,
                                   const nlohmann::json &input, const std::string &request_id) {
    return {{"type", "tool_input_progress"},
            {"tool_id", tool_id},
            {"partial_json", partial_json},
            {"input", input},
            {"request_id", request_id}};
}

nlohmann::json thinking(const std::string &content, const std::string &request_id) {
    return {{"type", "thinking"}, {"content", content}, {"request_id", request_id}};
}

nlohmann::json assistant_message(const std::string &content, const nlohmann::json &tool_calls,
                                 const std::string &request_id) {
    return {{"type", "assistant_message"},
            {"content", content},
            {"tool_calls", tool_calls.is_array() ? tool_calls : nlohmann::json::array()},
            {"request_id", request_id}};
}

nlohmann::json audio(const std::string &bytes, const std::string &format, int chunk_index, bool is_final,
                     const std::string &request_id) {
    return {{"type", "audio"},
            {"format", format},
            {"data", base64_encode(bytes)},
            {"chunk_index", chunk_index},
            {"is_final", is_final},
            {"request_id", request_id}};
}

nlohmann::json interrupted(const std::string &reason, const std::string &request_id) {
    return {{"type", "interrupted"}, {"reason", reason}, {"request_id", request_id}};
}

nlohmann::json config_updated(bool success) { return {{"type", "config_updated"}, {"success", success}}; }

nlohmann::json error(const std::string &message, const std::string &request_id) {
    nlohmann::json msg = {{"type", "error"}, {"message", message}};
    if (!request_id.empty()) {
        msg["request_id"] = request_id;
    }
    return msg;
}

}  // namespace messages
}  // namespace conversation
}  // namespace agentlink
