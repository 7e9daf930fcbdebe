#include "receptionist/providers/registry.hpp"

#include <algorithm>
#include <chrono>

#include "receptionist/logging.hpp"
#include "receptionist/providers/azure_synthesizer.hpp"
#include "receptionist/providers/deepgram_recognizer.hpp"
#include "receptionist/providers/elevenlabs_synthesizer.hpp"
#include "receptionist/providers/openai_generator.hpp"

namespace receptionist::providers {

namespace {

HttpRequestOptions request_options(double timeout_sec, const Config& config) {
    HttpRequestOptions options;
    const auto timeout = std::chrono::milliseconds(static_cast<long>(timeout_sec * 1000));
    options.request_timeout = timeout;
    options.read_timeout = timeout;
    options.connect_timeout =
        std::chrono::milliseconds(static_cast<long>(config.backend_connect_timeout * 1000));
    return options;
}

}

std::vector<std::string> resolve_synthesis_priority(const std::optional<std::string>& preferred,
                                                    bool azure_configured,
                                                    bool elevenlabs_configured) {
    auto configured = [&](const std::string& name) {
        return (name == "azure" && azure_configured) ||
               (name == "elevenlabs" && elevenlabs_configured);
    };
    std::vector<std::string> order;
    if (preferred && configured(*preferred)) {
        order.push_back(*preferred);
    }
    for (const char* name : {"azure", "elevenlabs"}) {
        if (configured(name) && std::find(order.begin(), order.end(), name) == order.end()) {
            order.push_back(name);
        }
    }
    return order;
}

SpeechProviders build_providers(const Config& config) {
    SpeechProviders providers;

    if (config.deepgram_api_key) {
        DeepgramSettings settings;
        settings.url = config.deepgram_url;
        settings.api_key = *config.deepgram_api_key;
        settings.model = config.deepgram_model;
        settings.endpointing_ms = config.asr_endpointing_ms;
        settings.utterance_end_ms = config.asr_utterance_end_ms;
        providers.recognizer = std::make_shared<DeepgramRecognizer>(settings);
    } else {
        logging::warn("DEEPGRAM_API_KEY missing; calls will not be transcribed");
    }

    if (config.llm_api_key) {
        OpenAiSettings settings;
        settings.base_url = config.llm_base_url;
        settings.api_key = *config.llm_api_key;
        settings.model = config.llm_model;
        settings.temperature = config.llm_temperature;
        settings.max_tokens = config.llm_max_tokens;
        settings.http = request_options(config.llm_timeout_sec, config);
        providers.generator = std::make_shared<OpenAiGenerator>(settings);
    } else {
        logging::warn("LLM_API_KEY missing; every reply will use the fallback utterance");
    }

    const bool azure_configured = config.azure_speech_key &&
                                  (config.azure_speech_region || config.azure_speech_endpoint);
    const bool elevenlabs_configured = config.elevenlabs_api_key.has_value();
    const auto order = resolve_synthesis_priority(config.tts_provider, azure_configured,
                                                  elevenlabs_configured);
    if (config.tts_provider && (order.empty() || order.front() != *config.tts_provider)) {
        logging::warn(
            "Preferred TTS provider has no credentials",
            {kv("provider", *config.tts_provider)});
    }

    for (const auto& name : order) {
        if (name == "azure") {
            AzureSettings settings;
            settings.api_key = *config.azure_speech_key;
            settings.region = config.azure_speech_region.value_or("");
            settings.endpoint = config.azure_speech_endpoint;
            settings.default_voice = config.azure_default_voice;
            settings.preset_voices = config.azure_voices;
            settings.http = request_options(config.tts_timeout_sec, config);
            providers.synthesizers.push_back(std::make_shared<AzureSynthesizer>(settings));
        } else if (name == "elevenlabs") {
            ElevenLabsSettings settings;
            settings.base_url = config.elevenlabs_base_url;
            settings.api_key = *config.elevenlabs_api_key;
            settings.model_id = config.elevenlabs_model_id;
            settings.preset_voices = config.elevenlabs_voices;
            settings.default_voice_id = config.elevenlabs_default_voice_id;
            settings.http = request_options(config.tts_timeout_sec, config);
            providers.synthesizers.push_back(std::make_shared<ElevenLabsSynthesizer>(settings));
        }
    }

    std::string names;
    for (const auto& synthesizer : providers.synthesizers) {
        names += names.empty() ? synthesizer->name() : "," + synthesizer->name();
    }
    logging::info(
        "Speech providers resolved",
        {kv("recognizer", providers.recognizer ? providers.recognizer->name() : "none"),
         kv("generator", providers.generator ? providers.generator->name() : "none"),
         kv("synthesizers", names.empty() ? "none" : names)});
    return providers;
}

}
