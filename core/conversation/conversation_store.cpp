#include "conversation_store.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

#include "logging/logger.hpp"

namespace agentlink {
namespace conversation {

namespace {

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(6) << us;
    return oss.str();
}

YAML::Node json_to_yaml(const nlohmann::json &value) {
    YAML::Node node;
    switch (value.type()) {
        case nlohmann::json::value_t::object:
            node = YAML::Node(YAML::NodeType::Map);
            for (auto it = value.begin(); it != value.end(); ++it) {
                node[it.key()] = json_to_yaml(it.value());
            }
            break;
        case nlohmann::json::value_t::array:
            node = YAML::Node(YAML::NodeType::Sequence);
            for (const auto &item : value) {
                node.push_back(json_to_yaml(item));
            }
            break;
        case nlohmann::json::value_t::string:
            node = value.get<std::string>();
            break;
        case nlohmann::json::value_t::boolean:
            node = value.get<bool>();
            break;
        case nlohmann::json::value_t::number_integer:
            node = value.get<int64_t>();
            break;
        case nlohmann::json::value_t::number_unsigned:
            node = value.get<uint64_t>();
            break;
        case nlohmann::json::value_t::number_float:
            node = value.get<double>();
            break;
        default:
            node = YAML::Node(YAML::NodeType::Null);
            break;
    }
    return node;
}

// Scalars come back typed where YAML can decide (bool, integer, float), else as strings
nlohmann::json yaml_to_json(const YAML::Node &node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto &kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Scalar: {
            if (node.Tag() == "!") {
                // Quoted in the file
                return node.as<std::string>();
            }
            bool b = false;
            if (YAML::convert<bool>::decode(node, b)) {
                return b;
            }
            int64_t i = 0;
            if (YAML::convert<int64_t>::decode(node, i)) {
                return i;
            }
            double d = 0.0;
            if (YAML::convert<double>::decode(node, d)) {
                return d;
            }
            return node.as<std::string>();
        }
        default:
            return nullptr;
    }
}

}  // namespace

ConversationStore::ConversationStore(const std::string &directory, const std::string &conversation_id)
    : directory_(directory), conversation_id_(conversation_id.empty() ? generate_id() : conversation_id) {}

std::string ConversationStore::generate_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 0xFFFFF);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(5) << dist(gen);
    return oss.str();
}

std::string ConversationStore::file_path() const {
    return (std::filesystem::path(directory_) / (conversation_id_ + ".yml")).string();
}

bool ConversationStore::initialize(std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        error = "Cannot create conversation directory '" + directory_ + "': " + ec.message();
        return false;
    }

    if (!load_locked(error)) {
        return false;
    }

    LOG_INFO("[Conversation] Initialized (ID: " << conversation_id_ << ", " << entries_.size() << " messages)");
    return true;
}

bool ConversationStore::load_locked(std::string &error) {
    const std::string path = file_path();
    if (!std::filesystem::exists(path)) {
        return true;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);
        entries_.clear();
        if (!root || root.IsNull()) {
            return true;
        }
        if (!root.IsSequence()) {
            LOG_ERROR("[Conversation] " << path << " is not a sequence, starting empty history");
            return true;
        }

        for (const auto &node : root) {
            if (!node.IsMap()) {
                continue;
            }
            ConversationEntry entry;
            if (node["role"]) {
                entry.role = node["role"].as<std::string>();
            }
            if (node["content"]) {
                entry.content = node["content"].as<std::string>();
            }
            if (node["timestamp"]) {
                entry.timestamp = node["timestamp"].as<std::string>();
            }
            if (node["tool_calls"]) {
                entry.tool_calls = yaml_to_json(node["tool_calls"]);
            }
            entries_.push_back(std::move(entry));
        }
        LOG_INFO("[Conversation] Loaded conversation with " << entries_.size() << " messages");
    } catch (const YAML::BadFile &e) {
        error = "Cannot open conversation file: " + path;
        return false;
    } catch (const YAML::Exception &e) {
        LOG_ERROR("[Conversation] Failed to load " << path << ": " << e.what() << " (starting empty history)");
        entries_.clear();
    }
    return true;
}

bool ConversationStore::save_locked() {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto &entry : entries_) {
        out << YAML::BeginMap;
        out << YAML::Key << "role" << YAML::Value << entry.role;
        out << YAML::Key << "content" << YAML::Value << entry.content;
        out << YAML::Key << "timestamp" << YAML::Value << entry.timestamp;
        if (entry.tool_calls.is_array() && !entry.tool_calls.empty()) {
            out << YAML::Key << "tool_calls" << YAML::Value << json_to_yaml(entry.tool_calls);
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    if (!out.good()) {
        error_ = "YAML emit error: " + out.GetLastError();
        LOG_ERROR("[Conversation] " << error_);
        return false;
    }

    const std::string path = file_path();
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) {
            error_ = "Cannot write " + tmp_path;
            LOG_ERROR("[Conversation] Failed to save conversation: " << error_);
            return false;
        }
        file << out.c_str() << "\n";
        if (!file) {
            error_ = "Write failed for " + tmp_path;
            LOG_ERROR("[Conversation] Failed to save conversation: " << error_);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        error_ = "Cannot replace " + path + ": " + ec.message();
        LOG_ERROR("[Conversation] Failed to save conversation: " << error_);
        return false;
    }

    LOG_DEBUG("[Conversation] Saved conversation to " << path);
    return true;
}

void ConversationStore::add_user_message(const std::string &content) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(ConversationEntry{"user", content, now_iso8601(), nlohmann::json::array()});
    save_locked();
}

void ConversationStore::add_assistant_message(const std::string &content, const nlohmann::json &tool_calls) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(ConversationEntry{"assistant", content, now_iso8601(),
                                         tool_calls.is_array() ? tool_calls : nlohmann::json::array()});
    save_locked();
}

std::vector<ConversationEntry> ConversationStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::vector<ConversationEntry> ConversationStore::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (limit == 0 || limit >= entries_.size()) {
        return entries_;
    }
    return std::vector<ConversationEntry>(entries_.end() - static_cast<std::ptrdiff_t>(limit), entries_.end());
}

std::vector<agent::HistoryEntry> ConversationStore::replay_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<agent::HistoryEntry> history;
    history.reserve(entries_.size());
    for (const auto &entry : entries_) {
        if (entry.role == "user" || entry.role == "assistant") {
            history.push_back(agent::HistoryEntry{entry.role, entry.content});
        }
    }
    return history;
}

void ConversationStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    save_locked();
    LOG_INFO("[Conversation] Conversation history cleared");
}

nlohmann::json ConversationStore::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t user_count = 0;
    size_t assistant_count = 0;
    for (const auto &entry : entries_) {
        if (entry.role == "user") {
            ++user_count;
        } else if (entry.role == "assistant") {
            ++assistant_count;
        }
    }
    return {{"conversation_id", conversation_id_},
            {"message_count", entries_.size()},
            {"user_messages", user_count},
            {"assistant_messages", assistant_count},
            {"file_path", file_path()}};
}

size_t ConversationStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace conversation
}  // namespace agentlink
