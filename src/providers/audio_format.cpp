#include "receptionist/providers/audio_format.hpp"

namespace receptionist::providers {

std::optional<AudioFormat> parse_audio_format(const std::string& name) {
    if (name == "pcm_16000") {
        return AudioFormat{AudioEncoding::Linear16, 16000};
    }
    if (name == "pcm_8000") {
        return AudioFormat{AudioEncoding::Linear16, 8000};
    }
    if (name == "ulaw_8000" || name == "mulaw_8000") {
        return AudioFormat{AudioEncoding::Mulaw, 8000};
    }
    return std::nullopt;
}

std::string to_string(const AudioFormat& format) {
    const char* prefix = format.encoding == AudioEncoding::Mulaw ? "ulaw_" : "pcm_";
    return prefix + std::to_string(format.sample_rate);
}

}
