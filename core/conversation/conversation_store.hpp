#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "agent/agent_types.hpp"

namespace agentlink {
namespace conversation {

struct ConversationEntry {
    std::string role;  // "user" or "assistant"
    std::string content;
    std::string timestamp;                               // ISO 8601, local time
    nlohmann::json tool_calls = nlohmann::json::array();  // assistant entries only
};

/**
 * @brief Append-only conversation history persisted as YAML
 *
 * One file per conversation: <directory>/<id>.yml, a sequence of maps with
 * role/content/timestamp and optional tool_calls. The file is rewritten after every
 * append (write to a temp file, then rename). A failed save is logged and the entry
 * is kept in memory.
 *
 * Thread-safe.
 */
class ConversationStore {
public:
    // An empty conversation_id generates a fresh 5-hex-digit id
    ConversationStore(const std::string &directory, const std::string &conversation_id = "");

    // Create the directory and load an existing file. A corrupt file starts an empty history.
    bool initialize(std::string &error);

    void add_user_message(const std::string &content);
    void add_assistant_message(const std::string &content,
                               const nlohmann::json &tool_calls = nlohmann::json::array());

    std::vector<ConversationEntry> snapshot() const;

    // Last `limit` entries (all if limit == 0)
    std::vector<ConversationEntry> recent(size_t limit) const;

    // Role/content pairs for replaying into a fresh agent process
    std::vector<agent::HistoryEntry> replay_history() const;

    void clear();

    // conversation_id, message_count, user_messages, assistant_messages, file_path
    nlohmann::json summary() const;

    size_t size() const;
    const std::string &id() const { return conversation_id_; }
    std::string file_path() const;
    const std::string &last_error() const { return error_; }

    static std::string generate_id();

private:
    bool save_locked();
    bool load_locked(std::string &error);

    std::string directory_;
    std::string conversation_id_;

    mutable std::mutex mutex_;
    std::vector<ConversationEntry> entries_;
    std::string error_;
};

}  // namespace conversation
}  // namespace agentlink
