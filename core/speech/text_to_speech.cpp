#include "text_to_speech.hpp"

#include <chrono>
#include <thread>

#include "agent/agent_process.hpp"
#include "logging/logger.hpp"

namespace agentlink {
namespace speech {

namespace {
constexpr int kReadSliceMs = 100;
constexpr int kTerminateGraceMs = 500;
constexpr size_t kMaxAudioBytes = 64 * 1024 * 1024;
}  // namespace

CommandTextToSpeech::CommandTextToSpeech(const TtsConfig &config) : config_(config) {}

bool CommandTextToSpeech::synthesize(const std::string &text, std::string &audio, std::string &error) {
    audio.clear();
    if (config_.command.empty()) {
        error = "TTS command not configured";
        return false;
    }

    agent::AgentProcess process("tts", config_.command, config_.args);
    if (!process.spawn()) {
        error = "Failed to start TTS command: " + process.last_error();
        return false;
    }

    auto &client = process.client();
    if (!client.write_line(text, config_.timeout_ms)) {
        error = "Failed to write text to TTS command: " + client.last_error();
        process.kill(kTerminateGraceMs);
        return false;
    }
    client.close_stdin();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeout_ms);
    std::string chunk;
    while (true) {
        if (std::chrono::steady_clock::now() >= deadline) {
            error = "TTS command timed out after " + std::to_string(config_.timeout_ms) + "ms";
            process.kill(kTerminateGraceMs);
            audio.clear();
            return false;
        }

        auto status = client.read_available(chunk, kReadSliceMs);
        if (status == agent::ReadStatus::LINE) {
            audio += chunk;
            if (audio.size() > kMaxAudioBytes) {
                error = "TTS output exceeds " + std::to_string(kMaxAudioBytes) + " bytes";
                process.kill(kTerminateGraceMs);
                audio.clear();
                return false;
            }
        } else if (status == agent::ReadStatus::END_OF_STREAM) {
            break;
        } else if (status == agent::ReadStatus::ERROR) {
            error = "Failed to read TTS output: " + client.last_error();
            process.kill(kTerminateGraceMs);
            audio.clear();
            return false;
        }
    }

    // Output closed; give the command a moment to exit on its own
    auto exit_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kTerminateGraceMs);
    while (process.is_running() && std::chrono::steady_clock::now() < exit_deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    process.terminate(kTerminateGraceMs);

    auto status = process.exit_status();
    if (status && *status != 0) {
        error = "TTS command exited with status " + std::to_string(*status);
        audio.clear();
        return false;
    }
    if (audio.empty()) {
        error = "TTS command produced no audio";
        return false;
    }

    LOG_DEBUG("[TTS] Synthesized " << audio.size() << " bytes for " << text.size() << " chars");
    return true;
}

}  // namespace speech
}  // namespace agentlink
