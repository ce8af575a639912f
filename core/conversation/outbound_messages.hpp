#pragma once

/**
 * @file outbound_messages.hpp
 * @brief JSON builders for client-facing conversation messages
 *
 * Every message is an object with a "type" discriminant. Request-scoped messages carry
 * "request_id" so a client can discard output of a request it no longer cares about.
 *
 *   session_info         session_id, working_dir, conversation_id, tool_profile
 *   processing           status ("thinking" | "complete"), request_id
 *   tool_use             tool, input, summary, request_id
 *   tool_summary         tool, input, summary, request_id
 *   text_block           content, is_final, request_id
 *   tool_input_progress  tool_id, partial_json, input, request_id
 *   thinking             content, request_id
 *   assistant_message    content, tool_calls[], request_id
 *   audio                format, data (base64), chunk_index, is_final, request_id
 *   interrupted          reason, request_id
 *   config_updated       success
 *   error                message, request_id (omitted when empty)
 */

#include <nlohmann/json.hpp>
#include <string>

namespace agentlink {
namespace conversation {
namespace messages {

nlohmann::json session_info(const std::string &session_id, const std::string &working_dir,
                            const std::string &conversation_id, const std::string &tool_profile);

nlohmann::json processing(const std::string &status, const std::string &request_id);

nlohmann::json tool_use(const std::string &tool, const nlohmann::json &input, const std::string &summary,
                        const std::string &request_id);

nlohmann::json tool_summary(const std::string &tool, const nlohmann::json &input, const std::string &summary,
                            const std::string &request_id);

nlohmann::json text_block(const std::string &content, bool is_final, const std::string &request_id);

nlohmann::json tool_input_progress(const std::string &tool_id, const std::string &partial_json,
                                   const nlohmann::json &input, const std::string &request_id);

nlohmann::json thinking(const std::string &content, const std::string &request_id);

nlohmann::json assistant_message(const std::string &content, const nlohmann::json &tool_calls,
                                 const std::string &request_id);

nlohmann::json audio(const std::string &bytes, const std::string &format, int chunk_index, bool is_final,
                     const std::string &request_id);

nlohmann::json interrupted(const std::string &reason, const std::string &request_id);

nlohmann::json config_updated(bool success);

nlohmann::json error(const std::string &message, const std::string &request_id = "");

std::string base64_encode(const std::string &bytes);
std::string base64_decode(const std::string &encoded);

}  // namespace messages
}  // namespace conversation
}  // namespace agentlink
