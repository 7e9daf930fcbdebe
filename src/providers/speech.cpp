#include "receptionist/providers/speech.hpp"

namespace receptionist::providers {

std::optional<std::string> VoiceCatalog::resolve(const VoiceSelection& selection) const {
    if (accepts_custom_voice && selection.custom_voice_id && !selection.custom_voice_id->empty()) {
        return selection.custom_voice_id;
    }
    const auto it = presets.find(selection.preset);
    if (it != presets.end() && !it->second.empty()) {
        return it->second;
    }
    if (!default_voice.empty()) {
        return default_voice;
    }
    return std::nullopt;
}

}
