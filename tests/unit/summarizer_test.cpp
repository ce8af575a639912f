/**
 * summarizer_test.cpp - tool-call summarizer tests
 *
 * The HTTP cases run AnthropicSummarizer against a local httplib::Server standing in for the
 * Messages API.
 */

#include "agent/summarizer.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

using namespace agentlink::agent;

TEST(SummarizerTest, FallbackSummary) {
    EXPECT_EQ(fallback_summary("Bash"), "Using Bash");
    EXPECT_EQ(fallback_summary("unknown"), "Using unknown");
}

TEST(SummarizerTest, PromptNamesToolAndInput) {
    std::string prompt = build_summary_prompt("Glob", {{"pattern", "**/*.py"}});

    EXPECT_NE(prompt.find("Tool: Glob"), std::string::npos);
    EXPECT_NE(prompt.find("**/*.py"), std::string::npos);
    EXPECT_NE(prompt.find("present continuous"), std::string::npos);
}

TEST(SummarizerTest, ExtractText) {
    EXPECT_EQ(AnthropicSummarizer::extract_text(R"({"content":[{"type":"text","text":" \"Reading README.md\"\n"}]})"),
              "Reading README.md");
    EXPECT_EQ(AnthropicSummarizer::extract_text("not json"), "");
    EXPECT_EQ(AnthropicSummarizer::extract_text(R"({"content":[]})"), "");
    EXPECT_EQ(AnthropicSummarizer::extract_text(R"({"content":[{"type":"image"}]})"), "");
    EXPECT_EQ(AnthropicSummarizer::extract_text(R"({"error":{"type":"overloaded_error"}})"), "");
}

TEST(SummarizerTest, MissingKeyUsesFallbackWithoutNetwork) {
    SummarizerConfig config;
    config.api_key = "";
    config.api_url = "http://127.0.0.1:1";
    AnthropicSummarizer summarizer(config);

    EXPECT_EQ(summarizer.summarize("Read", {{"file_path", "a.txt"}}), "Using Read");
}

TEST(SummarizerTest, DisabledUsesFallback) {
    SummarizerConfig config;
    config.enabled = false;
    config.api_key = "sk-test";
    AnthropicSummarizer summarizer(config);

    EXPECT_EQ(summarizer.summarize("Edit", {}), "Using Edit");
}

class SummarizerHttpTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<httplib::Server>();
        server_->Post("/v1/messages", [this](const httplib::Request &req, httplib::Response &res) {
            ++requests_;
            last_api_key_ = req.get_header_value("x-api-key");
            last_version_ = req.get_header_value("anthropic-version");
            last_body_ = req.body;
            res.status = status_;
            res.set_content(reply_, "application/json");
        });
        port_ = server_->bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this] { server_->listen_after_bind(); });
        server_->wait_until_ready();
    }

    void TearDown() override {
        server_->stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    SummarizerConfig make_config() {
        SummarizerConfig config;
        config.api_url = "http://127.0.0.1:" + std::to_string(port_);
        config.api_key = "sk-test";
        config.timeout_ms = 2000;
        return config;
    }

    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    int port_ = 0;

    int status_ = 200;
    std::string reply_;
    std::atomic<int> requests_{0};
    std::string last_api_key_;
    std::string last_version_;
    std::string last_body_;
};

TEST_F(SummarizerHttpTest, ReturnsModelText) {
    reply_ = R"({"content":[{"type":"text","text":"Listing files in current directory"}]})";
    AnthropicSummarizer summarizer(make_config());

    EXPECT_EQ(summarizer.summarize("Bash", {{"command", "ls"}}), "Listing files in current directory");
    EXPECT_EQ(requests_.load(), 1);
    EXPECT_EQ(last_api_key_, "sk-test");
    EXPECT_EQ(last_version_, "2023-06-01");

    auto body = nlohmann::json::parse(last_body_);
    EXPECT_EQ(body["model"], "claude-3-haiku-20240307");
    EXPECT_EQ(body["max_tokens"], 50);
    ASSERT_EQ(body["messages"].size(), 1u);
    EXPECT_EQ(body["messages"][0]["role"], "user");
    EXPECT_NE(body["messages"][0]["content"].get<std::string>().find("Tool: Bash"), std::string::npos);
}

TEST_F(SummarizerHttpTest, HttpErrorFallsBack) {
    status_ = 503;
    reply_ = R"({"type":"error","error":{"type":"overloaded_error"}})";
    AnthropicSummarizer summarizer(make_config());

    EXPECT_EQ(summarizer.summarize("Grep", {{"pattern", "TODO"}}), "Using Grep");
    EXPECT_EQ(requests_.load(), 1);
}

TEST_F(SummarizerHttpTest, MalformedBodyFallsBack) {
    reply_ = "{}";
    AnthropicSummarizer summarizer(make_config());

    EXPECT_EQ(summarizer.summarize("Write", {}), "Using Write");
}

TEST_F(SummarizerHttpTest, ConnectionErrorFallsBack) {
    SummarizerConfig config = make_config();
    server_->stop();
    thread_.join();
    AnthropicSummarizer summarizer(config);

    EXPECT_EQ(summarizer.summarize("Read", {}), "Using Read");
    EXPECT_EQ(requests_.load(), 0);
}
