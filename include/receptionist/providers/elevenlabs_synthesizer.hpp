#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "receptionist/http/client.hpp"
#include "receptionist/providers/speech.hpp"

namespace receptionist::providers {

struct ElevenLabsSettings {
    std::string base_url = "https://api.elevenlabs.io";
    std::string api_key;
    std::string model_id = "eleven_multilingual_v2";
    std::map<std::string, std::string> preset_voices;
    std::optional<std::string> default_voice_id;
    double stability = 0.5;
    double similarity_boost = 0.75;
    HttpRequestOptions http;
};

class ElevenLabsSynthesizer : public SpeechSynthesizer {
public:
    explicit ElevenLabsSynthesizer(ElevenLabsSettings settings);

    std::string name() const override { return "elevenlabs"; }
    const VoiceCatalog& voices() const override { return catalog_; }
    AudioBuffer synthesize(const std::string& text,
                           const std::string& voice_id,
                           const AudioFormat& format) override;

private:
    ElevenLabsSettings settings_;
    VoiceCatalog catalog_;
    std::unique_ptr<HttpClient> client_;
};

}
