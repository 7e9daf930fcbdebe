#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "receptionist/config.hpp"
#include "receptionist/providers/speech.hpp"

namespace receptionist::providers {

struct SpeechProviders {
    std::shared_ptr<SpeechRecognizer> recognizer;
    std::shared_ptr<TextGenerator> generator;
    // Tried in order by the synthesis chain.
    std::vector<std::shared_ptr<SpeechSynthesizer>> synthesizers;
};

// Explicit preference first, then every backend with credentials (Azure before
// ElevenLabs). The preference is dropped when its credentials are missing.
std::vector<std::string> resolve_synthesis_priority(const std::optional<std::string>& preferred,
                                                    bool azure_configured,
                                                    bool elevenlabs_configured);

SpeechProviders build_providers(const Config& config);

}
