#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "receptionist/http/client.hpp"
#include "receptionist/providers/speech.hpp"

namespace receptionist::providers {

struct AzureSettings {
    std::string api_key;
    std::string region;
    std::optional<std::string> endpoint;
    std::string default_voice = "en-AU-NatashaNeural";
    std::map<std::string, std::string> preset_voices;
    std::string language = "en-AU";
    HttpRequestOptions http;
};

class AzureSynthesizer : public SpeechSynthesizer {
public:
    explicit AzureSynthesizer(AzureSettings settings);

    std::string name() const override { return "azure"; }
    const VoiceCatalog& voices() const override { return catalog_; }
    AudioBuffer synthesize(const std::string& text,
                           const std::string& voice_id,
                           const AudioFormat& format) override;

    static std::string build_ssml(const std::string& text,
                                  const std::string& voice_id,
                                  const std::string& language);
    static std::optional<std::string> output_format_header(const AudioFormat& format);

private:
    AzureSettings settings_;
    VoiceCatalog catalog_;
    std::unique_ptr<HttpClient> client_;
};

}
