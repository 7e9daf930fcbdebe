#include "receptionist/providers/elevenlabs_synthesizer.hpp"

#include <nlohmann/json.hpp>

#include "receptionist/logging.hpp"
#include "receptionist/utils/http.hpp"

namespace receptionist::providers {

ElevenLabsSynthesizer::ElevenLabsSynthesizer(ElevenLabsSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.api_key.empty()) {
        throw SynthesisFailure("ElevenLabs API key is not configured");
    }
    catalog_.presets = settings_.preset_voices;
    catalog_.default_voice = settings_.default_voice_id.value_or("");
    catalog_.accepts_custom_voice = true;
    client_ = std::make_unique<HttpClient>(
        settings_.base_url,
        httplib::Headers{{"xi-api-key", settings_.api_key}},
        settings_.http);
}

AudioBuffer ElevenLabsSynthesizer::synthesize(const std::string& text,
                                              const std::string& voice_id,
                                              const AudioFormat& format) {
    const nlohmann::json body = {
        {"text", text},
        {"model_id", settings_.model_id},
        {"voice_settings",
         {{"stability", settings_.stability},
          {"similarity_boost", settings_.similarity_boost}}},
    };
    const auto path = "/v1/text-to-speech/" + utils::url_encode(voice_id) +
                      "?output_format=" + to_string(format);
    try {
        auto response = client_->post(path, {{"Accept", "audio/*"}}, body.dump(),
                                      "application/json");
        if (response.body.empty()) {
            throw SynthesisFailure("ElevenLabs returned no audio", response.status);
        }
        logging::debug(
            "ElevenLabs synthesis complete",
            {kv("voice_id", voice_id),
             kv("bytes", response.body.size()),
             kv("format", to_string(format))});
        return {format, std::move(response.body)};
    } catch (const HttpError& ex) {
        throw SynthesisFailure(ex.what(), ex.status());
    }
}

}
