#include "summarizer.hpp"

// cpp-httplib with OpenSSL support (CPPHTTPLIB_OPENSSL_SUPPORT set by the build when OpenSSL is found)
#include <httplib.h>

#include <chrono>

#include "logging/logger.hpp"

namespace agentlink {
namespace agent {

namespace {
constexpr int kStatusOk = 200;
constexpr const char *kApiVersion = "2023-06-01";

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n\"";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}
}  // namespace

std::string fallback_summary(const std::string &tool_name) { return "Using " + tool_name; }

std::string build_summary_prompt(const std::string &tool_name, const nlohmann::json &tool_input) {
    return "Summarize this action in one SHORT, SPECIFIC sentence (under 12 words) using present continuous "
           "tense (verb + -ing).\n\n"
           "Tool: " +
           tool_name + "\nInput: " + tool_input.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) +
           "\n\n"
           "Be SPECIFIC - include important details like:\n"
           "- File/directory names or patterns\n"
           "- Search terms or paths\n"
           "- Key parameters\n\n"
           "Examples:\n"
           "- \"Searching home folder for Python files\"\n"
           "- \"Reading README.md file\"\n"
           "- \"Listing contents of Photos directory\"\n"
           "- \"Running git status in current repo\"\n\n"
           "Reply with ONLY the specific summary sentence starting with a verb ending in -ing, no extra words.";
}

AnthropicSummarizer::AnthropicSummarizer(const SummarizerConfig &config) : config_(config) {}

std::string AnthropicSummarizer::extract_text(const std::string &response_body) {
    nlohmann::json body = nlohmann::json::parse(response_body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return "";
    }
    auto content = body.find("content");
    if (content == body.end() || !content->is_array() || content->empty()) {
        return "";
    }
    const auto &first = (*content)[0];
    if (!first.is_object() || !first.contains("text") || !first["text"].is_string()) {
        return "";
    }
    return trim(first["text"].get<std::string>());
}

std::string AnthropicSummarizer::summarize(const std::string &tool_name, const nlohmann::json &tool_input) {
    if (!config_.enabled || config_.api_key.empty()) {
        return fallback_summary(tool_name);
    }

    // httplib::Client auto-detects scheme and handles SSL when built with OpenSSL
    httplib::Client client(config_.api_url);
    client.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    client.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
    client.set_write_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers = {{"x-api-key", config_.api_key}, {"anthropic-version", kApiVersion}};

    nlohmann::json request = {
        {"model", config_.model},
        {"max_tokens", config_.max_tokens},
        {"messages", nlohmann::json::array({{{"role", "user"}, {"content", build_summary_prompt(tool_name, tool_input)}}})}};

    auto result = client.Post("/v1/messages", headers, request.dump(), "application/json");
    if (!result) {
        LOG_ERROR("[Summarizer] Connection error: " << httplib::to_string(result.error()));
        return fallback_summary(tool_name);
    }
    if (result->status != kStatusOk) {
        LOG_ERROR("[Summarizer] HTTP " << result->status << ": " << result->body);
        return fallback_summary(tool_name);
    }

    std::string summary = extract_text(result->body);
    if (summary.empty()) {
        LOG_WARN("[Summarizer] Empty or malformed response for " << tool_name);
        return fallback_summary(tool_name);
    }
    return summary;
}

}  // namespace agent
}  // namespace agentlink
