#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "receptionist/providers/speech.hpp"

namespace receptionist::providers {

struct DeepgramSettings {
    std::string url = "wss://api.deepgram.com/v1/listen";
    std::string api_key;
    std::string model = "nova-3";
    int endpointing_ms = 300;
    int utterance_end_ms = 1000;
    std::chrono::milliseconds keepalive_interval{5000};
};

// Folds Deepgram "Results" / "UtteranceEnd" messages into interim and final
// transcript events. is_final segments accumulate until speech_final or
// UtteranceEnd closes the utterance.
class DeepgramTranscriptAssembler {
public:
    std::optional<TranscriptEvent> handle(const nlohmann::json& message);
    std::optional<TranscriptEvent> flush();

private:
    std::string finals_;
    double confidence_ = 0.0;
};

class DeepgramRecognizer : public SpeechRecognizer {
public:
    explicit DeepgramRecognizer(DeepgramSettings settings);

    std::string name() const override { return "deepgram"; }
    std::unique_ptr<RecognitionStream> start(const RecognitionOptions& options) override;

    std::string build_url(const RecognitionOptions& options) const;

private:
    DeepgramSettings settings_;
};

}
