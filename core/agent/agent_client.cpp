#include "agent_client.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <variant>

#include "logging/logger.hpp"
#include "stream_protocol.hpp"

namespace agentlink {
namespace agent {

namespace {

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

StreamOutcome failed(const std::string &message, std::vector<ToolCallRecord> tool_calls = {}) {
    StreamOutcome outcome;
    outcome.success = false;
    outcome.response = message;
    outcome.tool_calls = std::move(tool_calls);
    return outcome;
}

}  // namespace

AgentClient::AgentClient(const AgentConfig &config, std::shared_ptr<ISummarizer> summarizer)
    : config_(config), supervisor_(config), summarizer_(std::move(summarizer)) {}

AgentClient::~AgentClient() { cleanup(); }

bool AgentClient::write_exchange(const std::shared_ptr<AgentProcess> &handle, const std::string &prompt,
                                 const std::vector<HistoryEntry> &history, const StopCheck &stop_reason,
                                 std::string &error) {
    auto &client = handle->client();

    if (supervisor_.needs_history_replay()) {
        if (!history.empty()) {
            LOG_INFO("[AgentClient] Replaying " << history.size() << " history messages to new process");
        }
        for (const auto &entry : history) {
            if (const char *reason = stop_reason()) {
                error = reason;
                return false;
            }
            if (!client.write_line(protocol::encode_message(entry.role, entry.content), config_.write_timeout_ms)) {
                error = client.last_error();
                return false;
            }
        }
        supervisor_.mark_history_replayed(handle);
    }

    if (const char *reason = stop_reason()) {
        error = reason;
        return false;
    }
    if (!client.write_line(protocol::encode_message("user", prompt), config_.write_timeout_ms)) {
        error = client.last_error();
        return false;
    }
    return true;
}

std::shared_ptr<AgentProcess> AgentClient::send_prompt(const std::string &prompt,
                                                       const std::vector<HistoryEntry> &history,
                                                       const StopCheck &stop_reason, std::string &error) {
    constexpr int kMaxAttempts = 2;

    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        std::string start_error;
        auto handle = supervisor_.ensure_started(start_error);
        if (!handle) {
            error = "Failed to start Claude process: " + start_error;
            return nullptr;
        }

        std::string write_error;
        if (write_exchange(handle, prompt, history, stop_reason, write_error)) {
            return handle;
        }

        // An interrupt kills the process mid-write; that broken pipe is not a crash to recover from
        if (const char *reason = stop_reason()) {
            abandon(handle);
            error = reason;
            return nullptr;
        }

        // A write failure means the process is gone or wedged; treat it as a crash
        supervisor_.discard(handle);
        if (attempt < kMaxAttempts) {
            LOG_WARN("[AgentClient] Write failed (" << write_error << "), restarting agent and retrying");
            continue;
        }
        error = "Failed to write to Claude process: " + write_error;
    }
    return nullptr;
}

void AgentClient::abandon(const std::shared_ptr<AgentProcess> &handle) {
    if (supervisor_.is_current(handle)) {
        supervisor_.discard(handle);
    }
}

StreamOutcome AgentClient::execute_streaming(const std::string &prompt, const StreamCallbacks &callbacks,
                                             const std::vector<HistoryEntry> &history,
                                             const InterruptPredicate &is_interrupted,
                                             const CancellationToken *cancel) {
    std::lock_guard<std::mutex> exchange_lock(exchange_mutex_);

    // Returns the failure text if the exchange must stop now, nullptr otherwise
    auto stop_reason = [&]() -> const char * {
        if (is_interrupted && is_interrupted()) {
            return kInterruptedMessage;
        }
        if (cancel && cancel->is_cancelled()) {
            return kCancelledMessage;
        }
        return nullptr;
    };

    if (const char *reason = stop_reason()) {
        LOG_INFO("[AgentClient] " << reason << " before send");
        return failed(reason);
    }

    std::string error;
    auto handle = send_prompt(prompt, history, stop_reason, error);
    if (!handle) {
        if (const char *reason = stop_reason()) {
            LOG_INFO("[AgentClient] " << reason << " during send");
            return failed(reason);
        }
        LOG_ERROR("[AgentClient] " << error);
        return failed(error);
    }

    std::vector<ToolCallRecord> tool_calls;
    std::vector<std::string> sent_text_blocks;
    std::string last_text_block;
    std::optional<std::string> final_response;

    auto stop_exchange = [&](const char *reason) {
        LOG_INFO("[AgentClient] " << reason);
        abandon(handle);
        return failed(reason, tool_calls);
    };

    auto &client = handle->client();
    std::string line;

    while (!final_response) {
        if (const char *reason = stop_reason()) {
            return stop_exchange(reason);
        }

        ReadStatus status = client.read_line(line, config_.poll_interval_ms);

        if (const char *reason = stop_reason()) {
            return stop_exchange(reason);
        }

        if (status == ReadStatus::TIMEOUT) {
            continue;
        }
        if (status == ReadStatus::END_OF_STREAM) {
            LOG_WARN("[AgentClient] Agent process closed its output before a result");
            break;
        }
        if (status == ReadStatus::ERROR) {
            LOG_ERROR("[AgentClient] Read failed: " << client.last_error());
            break;
        }

        if (trim(line).empty()) {
            continue;
        }

        auto event = protocol::decode_line(line);
        if (!event) {
            LOG_DEBUG("[AgentClient] Skipping unrecognized line: " << line.substr(0, 200));
            continue;
        }

        if (const char *reason = stop_reason()) {
            return stop_exchange(reason);
        }

        try {
            if (std::holds_alternative<protocol::SystemEvent>(*event)) {
                LOG_DEBUG("[AgentClient] System event: " << std::get<protocol::SystemEvent>(*event).subtype);

            } else if (auto *assistant = std::get_if<protocol::AssistantContentEvent>(&*event)) {
                for (const auto &block : assistant->blocks) {
                    if (const char *reason = stop_reason()) {
                        return stop_exchange(reason);
                    }

                    if (auto *text = std::get_if<protocol::TextBlock>(&block)) {
                        if (text->text.empty()) {
                            continue;
                        }
                        sent_text_blocks.push_back(text->text);
                        last_text_block = text->text;
                        if (callbacks.on_text_block) {
                            callbacks.on_text_block(text->text, false);
                        }
                    } else if (auto *tool = std::get_if<protocol::ToolUseBlock>(&block)) {
                        tool_calls.push_back(ToolCallRecord{tool->name, tool->id, tool->input});
                        LOG_INFO("[AgentClient] Tool use: " << tool->name);
                        if (callbacks.on_tool_use) {
                            callbacks.on_tool_use(tool->name, tool->input, fallback_summary(tool->name));
                        }
                        start_summary_job(tool->name, tool->input, callbacks, is_interrupted);
                    }
                }

            } else if (auto *delta = std::get_if<protocol::ContentDeltaEvent>(&*event)) {
                if (auto *input = std::get_if<protocol::InputJsonDelta>(&delta->delta)) {
                    if (callbacks.on_tool_input_progress) {
                        callbacks.on_tool_input_progress(input->index, input->partial_json,
                                                         protocol::parse_partial_tool_input(input->partial_json));
                    }
                } else if (auto *thinking = std::get_if<protocol::ThinkingDelta>(&delta->delta)) {
                    if (callbacks.on_thinking_block && !thinking->text.empty()) {
                        callbacks.on_thinking_block(thinking->text);
                    }
                }

            } else if (auto *result = std::get_if<protocol::ResultEvent>(&*event)) {
                if (result->is_error) {
                    LOG_WARN("[AgentClient] Agent reported an error result");
                }
                final_response = trim(result->text);
            }
        } catch (const std::exception &e) {
            // A failing observer must not derail the exchange
            LOG_ERROR("[AgentClient] Callback error: " << e.what());
        }
    }

    if (!final_response) {
        if (const char *reason = stop_reason()) {
            return stop_exchange(reason);
        }
        abandon(handle);
        return failed(kNoResponseMessage, tool_calls);
    }
    if (final_response->empty()) {
        // The exchange completed, so the process stays in sync and is kept
        LOG_WARN("[AgentClient] Agent returned an empty result");
        return failed(kNoResponseMessage, tool_calls);
    }

    StreamOutcome outcome;
    outcome.success = true;
    outcome.response = *final_response;
    outcome.tool_calls = std::move(tool_calls);
    outcome.already_sent_as_text_block =
        std::find(sent_text_blocks.begin(), sent_text_blocks.end(), outcome.response) != sent_text_blocks.end();

    if (outcome.already_sent_as_text_block && last_text_block == outcome.response && callbacks.on_text_block &&
        !stop_reason()) {
        try {
            callbacks.on_text_block(outcome.response, true);
        } catch (const std::exception &e) {
            LOG_ERROR("[AgentClient] Callback error: " << e.what());
        }
    }

    LOG_INFO("[AgentClient] Exchange complete (" << outcome.tool_calls.size() << " tool calls, "
                                                  << outcome.response.size() << " chars)");
    return outcome;
}

void AgentClient::start_summary_job(const std::string &tool_name, const nlohmann::json &tool_input,
                                    const StreamCallbacks &callbacks, const InterruptPredicate &is_interrupted) {
    if (!summarizer_ || !callbacks.on_tool_summary_update) {
        return;
    }

    reap_finished_jobs();

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto summarizer = summarizer_;
    auto on_update = callbacks.on_tool_summary_update;
    InterruptPredicate interrupted = is_interrupted;

    std::thread worker([summarizer, on_update, interrupted, done, tool_name, tool_input]() {
        try {
            std::string summary = summarizer->summarize(tool_name, tool_input);
            if (interrupted && interrupted()) {
                LOG_DEBUG("[AgentClient] Dropping summary for " << tool_name << " (request interrupted)");
            } else {
                on_update(tool_name, tool_input, summary);
            }
        } catch (const std::exception &e) {
            LOG_ERROR("[AgentClient] Summary job for " << tool_name << " failed: " << e.what());
        }
        done->store(true);
    });

    std::lock_guard<std::mutex> lock(jobs_mutex_);
    jobs_.push_back(SummaryJob{std::move(worker), done});
}

void AgentClient::reap_finished_jobs() {
    std::vector<SummaryJob> finished;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = std::partition(jobs_.begin(), jobs_.end(), [](const SummaryJob &job) { return !job.done->load(); });
        std::move(it, jobs_.end(), std::back_inserter(finished));
        jobs_.erase(it, jobs_.end());
    }
    for (auto &job : finished) {
        if (job.thread.joinable()) {
            job.thread.join();
        }
    }
}

size_t AgentClient::pending_background_tasks() {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    return static_cast<size_t>(
        std::count_if(jobs_.begin(), jobs_.end(), [](const SummaryJob &job) { return !job.done->load(); }));
}

void AgentClient::wait_for_background_tasks() {
    std::vector<SummaryJob> jobs;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        jobs.swap(jobs_);
    }
    for (auto &job : jobs) {
        if (job.thread.joinable()) {
            job.thread.join();
        }
    }
}

void AgentClient::interrupt_and_restart() { supervisor_.kill_and_invalidate(); }

void AgentClient::cleanup() {
    wait_for_background_tasks();
    supervisor_.shutdown();
}

}  // namespace agent
}  // namespace agentlink
