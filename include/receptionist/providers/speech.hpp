#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "receptionist/providers/audio_format.hpp"

namespace receptionist::providers {

class AdapterError : public std::runtime_error {
public:
    AdapterError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    // Upstream HTTP status, 0 when the request never produced a response.
    int status() const { return status_; }

private:
    int status_;
};

class RecognitionFailure : public AdapterError {
public:
    using AdapterError::AdapterError;
};

class GenerationFailure : public AdapterError {
public:
    using AdapterError::AdapterError;
};

class SynthesisFailure : public AdapterError {
public:
    using AdapterError::AdapterError;
};

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline bool is_cancelled(const CancelFlag& flag) {
    return flag && flag->load();
}

// Streaming recognition.

enum class TranscriptKind {
    Interim,
    Final,
};

struct TranscriptEvent {
    std::string text;
    TranscriptKind kind = TranscriptKind::Interim;
    double confidence = 0.0;
};

struct RecognitionOptions {
    int sample_rate = 16000;
    std::string language = "en";
    std::string call_sid;
};

class RecognitionStream {
public:
    virtual ~RecognitionStream() = default;

    // Little-endian linear PCM at the negotiated sample rate.
    virtual void send_audio(const std::string& pcm) = 0;
    // No more audio; pending finals are flushed before the sequence ends.
    virtual void finish() = 0;
    // Ends the event sequence immediately.
    virtual void close() = 0;
    // Blocks for the next event; nullopt once the stream has ended.
    virtual std::optional<TranscriptEvent> next_event() = 0;
};

class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;
    virtual std::string name() const = 0;
    virtual std::unique_ptr<RecognitionStream> start(const RecognitionOptions& options) = 0;
};

// Text generation.

struct ChatMessage {
    std::string role;
    std::string content;
};

struct GenerationRequest {
    std::string system_prompt;
    std::vector<ChatMessage> messages;
    bool allow_function_calls = true;
};

struct AssistantUtterance {
    std::string text;
};

struct FunctionCall {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
    std::string spoken_text;
};

using GenerationResult = std::variant<AssistantUtterance, FunctionCall>;

class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual std::string name() const = 0;
    virtual GenerationResult generate(const GenerationRequest& request,
                                      const CancelFlag& cancelled) = 0;
};

// Synthesis.

struct VoiceSelection {
    std::string preset = "koala_warm";
    std::optional<std::string> custom_voice_id;
};

struct VoiceCatalog {
    std::map<std::string, std::string> presets;
    std::string default_voice;
    bool accepts_custom_voice = false;

    std::optional<std::string> resolve(const VoiceSelection& selection) const;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    virtual std::string name() const = 0;
    virtual const VoiceCatalog& voices() const = 0;
    virtual AudioBuffer synthesize(const std::string& text,
                                   const std::string& voice_id,
                                   const AudioFormat& format) = 0;
};

}
