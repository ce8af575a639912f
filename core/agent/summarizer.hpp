#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace agentlink {
namespace agent {

struct SummarizerConfig {
    bool enabled = true;
    std::string api_url = "https://api.anthropic.com";  // Scheme + host
    std::string api_key;                                // Resolved at config load (literal or from env)
    std::string api_key_env = "ANTHROPIC_API_KEY";
    std::string model = "claude-3-haiku-20240307";
    int max_tokens = 50;
    int timeout_ms = 10000;
};

// Turns a raw tool invocation into a short human-readable sentence. Blocking.
class ISummarizer {
public:
    virtual ~ISummarizer() = default;
    virtual std::string summarize(const std::string &tool_name, const nlohmann::json &tool_input) = 0;
};

// "Using <tool>" - the placeholder sent before any summary is available, and the fallback on failure
std::string fallback_summary(const std::string &tool_name);

// Prompt asking for one short present-continuous sentence about the tool call
std::string build_summary_prompt(const std::string &tool_name, const nlohmann::json &tool_input);

// Summarizer backed by the Anthropic Messages API (POST /v1/messages)
class AnthropicSummarizer : public ISummarizer {
public:
    explicit AnthropicSummarizer(const SummarizerConfig &config);

    std::string summarize(const std::string &tool_name, const nlohmann::json &tool_input) override;

    // Extract content[0].text from a Messages API response body. Empty on malformed input.
    static std::string extract_text(const std::string &response_body);

private:
    SummarizerConfig config_;
};

}  // namespace agent
}  // namespace agentlink
