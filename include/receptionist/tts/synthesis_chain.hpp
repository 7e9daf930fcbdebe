#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "receptionist/providers/speech.hpp"
#include "receptionist/tts/cache.hpp"

namespace receptionist::tts {

// Renders text through the cache and then each synthesizer in priority order.
// Every failure ends in nullopt, which callers treat as "skip playback".
class SynthesisChain {
public:
    SynthesisChain(std::vector<std::shared_ptr<providers::SpeechSynthesizer>> synthesizers,
                   std::shared_ptr<TtsCache> cache,
                   providers::AudioFormat output_format);

    std::optional<providers::AudioBuffer> synthesize(
        const std::string& text,
        const providers::VoiceSelection& voice,
        const providers::CancelFlag& cancelled = nullptr);

    // Same as synthesize(), converted to 8 kHz mu-law for the media transport.
    std::optional<std::string> synthesize_for_transport(
        const std::string& text,
        const providers::VoiceSelection& voice,
        const providers::CancelFlag& cancelled = nullptr);

    bool empty() const { return synthesizers_.empty(); }

private:
    struct Candidate {
        std::shared_ptr<providers::SpeechSynthesizer> synthesizer;
        std::string voice_id;
        std::string cache_key;
    };

    std::vector<Candidate> candidates_for(const std::string& text,
                                          const providers::VoiceSelection& voice) const;
    std::optional<providers::AudioBuffer> render(const Candidate& candidate,
                                                 const std::string& text);

    std::vector<std::shared_ptr<providers::SpeechSynthesizer>> synthesizers_;
    std::shared_ptr<TtsCache> cache_;
    providers::AudioFormat output_format_;
};

}
