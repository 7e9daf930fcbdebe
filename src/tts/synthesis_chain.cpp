#include "receptionist/tts/synthesis_chain.hpp"

#include <chrono>

#include "receptionist/audio/codec.hpp"
#include "receptionist/audio/wav.hpp"
#include "receptionist/logging.hpp"
#include "receptionist/metrics.hpp"

namespace receptionist::tts {

SynthesisChain::SynthesisChain(
    std::vector<std::shared_ptr<providers::SpeechSynthesizer>> synthesizers,
    std::shared_ptr<TtsCache> cache,
    providers::AudioFormat output_format)
    : synthesizers_(std::move(synthesizers)),
      cache_(std::move(cache)),
      output_format_(output_format) {}

std::vector<SynthesisChain::Candidate> SynthesisChain::candidates_for(
    const std::string& text,
    const providers::VoiceSelection& voice) const {
    std::vector<Candidate> candidates;
    for (const auto& synthesizer : synthesizers_) {
        const auto voice_id = synthesizer->voices().resolve(voice);
        if (!voice_id) {
            logging::debug(
                "Synthesizer has no voice for selection",
                {kv("provider", synthesizer->name()),
                 kv("preset", voice.preset)});
            continue;
        }
        candidates.push_back({synthesizer, *voice_id,
                              TtsCache::make_key(synthesizer->name(), *voice_id, text)});
    }
    return candidates;
}

std::optional<providers::AudioBuffer> SynthesisChain::synthesize(
    const std::string& text,
    const providers::VoiceSelection& voice,
    const providers::CancelFlag& cancelled) {
    if (text.empty()) {
        return std::nullopt;
    }
    const auto candidates = candidates_for(text, voice);
    if (cache_) {
        for (const auto& candidate : candidates) {
            if (auto cached = cache_->get(candidate.cache_key)) {
                Metrics::instance().record_tts_cache(true);
                return cached;
            }
        }
    }
    Metrics::instance().record_tts_cache(false);

    for (const auto& candidate : candidates) {
        if (providers::is_cancelled(cancelled)) {
            return std::nullopt;
        }
        auto audio = render(candidate, text);
        if (!audio) {
            continue;
        }
        if (cache_) {
            cache_->put(candidate.cache_key, *audio);
        }
        return audio;
    }
    logging::warn(
        "All synthesizers failed; skipping playback",
        {kv("providers", candidates.size()),
         kv("text", text)});
    return std::nullopt;
}

std::optional<providers::AudioBuffer> SynthesisChain::render(const Candidate& candidate,
                                                             const std::string& text) {
    const auto& provider = candidate.synthesizer->name();
    const auto start = std::chrono::steady_clock::now();
    providers::AudioBuffer audio;
    try {
        audio = candidate.synthesizer->synthesize(text, candidate.voice_id, output_format_);
    } catch (const providers::AdapterError& ex) {
        Metrics::instance().record_provider_failure("synthesis", provider);
        logging::warn(
            "Synthesis failed",
            {kv("provider", provider),
             kv("status", ex.status()),
             kv("error", ex.what())});
        return std::nullopt;
    } catch (const std::exception& ex) {
        Metrics::instance().record_provider_failure("synthesis", provider);
        logging::warn(
            "Synthesis failed",
            {kv("provider", provider),
             kv("error", ex.what())});
        return std::nullopt;
    }
    Metrics::instance().observe_latency(
        "synthesis",
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());

    if (audio::is_wav(audio.bytes)) {
        auto payload = audio::extract_wav_payload(audio.bytes);
        if (!payload) {
            Metrics::instance().record_provider_failure("synthesis", provider);
            logging::warn(
                "Synthesis returned an unreadable WAV envelope",
                {kv("provider", provider),
                 kv("bytes", audio.bytes.size())});
            return std::nullopt;
        }
        audio = std::move(*payload);
    }
    if (audio.bytes.empty()) {
        logging::warn(
            "Synthesis returned no samples",
            {kv("provider", provider)});
        return std::nullopt;
    }
    logging::debug(
        "Synthesis complete",
        {kv("provider", provider),
         kv("voice", candidate.voice_id),
         kv("bytes", audio.bytes.size())});
    return audio;
}

std::optional<std::string> SynthesisChain::synthesize_for_transport(
    const std::string& text,
    const providers::VoiceSelection& voice,
    const providers::CancelFlag& cancelled) {
    auto audio = synthesize(text, voice, cancelled);
    if (!audio) {
        return std::nullopt;
    }
    auto transport = audio::to_transport(*audio);
    if (!transport) {
        logging::warn(
            "Synthesized audio has no conversion to the transport format",
            {kv("format", providers::to_string(audio->format))});
    }
    return transport;
}

}
