#pragma once

#include <string>
#include <vector>

namespace agentlink {
namespace speech {

struct TtsConfig {
    bool enabled = false;
    std::string command;            // e.g. "piper"; reads text on stdin, writes audio to stdout
    std::vector<std::string> args;  // e.g. ["--model", "en_US-amy-medium.onnx", "--output_file", "-"]
    int timeout_ms = 30000;
    std::string format = "wav";
    size_t chunk_size = 32768;  // Bytes per outbound audio message
};

// Accepts text, produces an audio byte sequence
class ITextToSpeech {
public:
    virtual ~ITextToSpeech() = default;

    // Returns false on failure (error set)
    virtual bool synthesize(const std::string &text, std::string &audio, std::string &error) = 0;

    virtual std::string format() const = 0;
};

/**
 * @brief Synthesizer backed by an external command
 *
 * One process per call: text goes to stdin (then EOF), all stdout bytes are the audio.
 * The process is killed if it exceeds timeout_ms.
 */
class CommandTextToSpeech : public ITextToSpeech {
public:
    explicit CommandTextToSpeech(const TtsConfig &config);

    bool synthesize(const std::string &text, std::string &audio, std::string &error) override;
    std::string format() const override { return config_.format; }

private:
    TtsConfig config_;
};

}  // namespace speech
}  // namespace agentlink
