#include "receptionist/providers/azure_synthesizer.hpp"

#include "receptionist/logging.hpp"
#include "receptionist/utils/text.hpp"

namespace receptionist::providers {

AzureSynthesizer::AzureSynthesizer(AzureSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.api_key.empty() || (settings_.region.empty() && !settings_.endpoint)) {
        throw SynthesisFailure("Azure speech key and region are not configured");
    }
    catalog_.presets = settings_.preset_voices;
    catalog_.default_voice = settings_.default_voice;
    catalog_.accepts_custom_voice = false;
    const auto endpoint = settings_.endpoint.value_or(
        "https://" + settings_.region + ".tts.speech.microsoft.com");
    client_ = std::make_unique<HttpClient>(
        endpoint,
        httplib::Headers{{"Ocp-Apim-Subscription-Key", settings_.api_key},
                         {"User-Agent", "receptionist-core"}},
        settings_.http);
}

std::string AzureSynthesizer::build_ssml(const std::string& text,
                                         const std::string& voice_id,
                                         const std::string& language) {
    return "<speak version=\"1.0\" xml:lang=\"" + language + "\"><voice name=\"" +
           utils::xml_escape(voice_id) + "\">" + utils::xml_escape(text) +
           "</voice></speak>";
}

std::optional<std::string> AzureSynthesizer::output_format_header(const AudioFormat& format) {
    if (format.encoding == AudioEncoding::Mulaw && format.sample_rate == 8000) {
        return std::string("raw-8khz-8bit-mono-mulaw");
    }
    if (format.encoding == AudioEncoding::Linear16 && format.sample_rate == 16000) {
        return std::string("riff-16khz-16bit-mono-pcm");
    }
    if (format.encoding == AudioEncoding::Linear16 && format.sample_rate == 8000) {
        return std::string("riff-8khz-16bit-mono-pcm");
    }
    return std::nullopt;
}

AudioBuffer AzureSynthesizer::synthesize(const std::string& text,
                                         const std::string& voice_id,
                                         const AudioFormat& format) {
    const auto output_format = output_format_header(format);
    if (!output_format) {
        throw SynthesisFailure("Azure has no output format for " + to_string(format));
    }
    try {
        auto response = client_->post("/cognitiveservices/v1",
                                      {{"X-Microsoft-OutputFormat", *output_format}},
                                      build_ssml(text, voice_id, settings_.language),
                                      "application/ssml+xml");
        if (response.body.empty()) {
            throw SynthesisFailure("Azure returned no audio", response.status);
        }
        logging::debug(
            "Azure synthesis complete",
            {kv("voice", voice_id),
             kv("bytes", response.body.size()),
             kv("format", *output_format)});
        return {format, std::move(response.body)};
    } catch (const HttpError& ex) {
        throw SynthesisFailure(ex.what(), ex.status());
    }
}

}
