#pragma once

#include <optional>
#include <string>

namespace receptionist::providers {

enum class AudioEncoding {
    Linear16,
    Mulaw,
};

struct AudioFormat {
    AudioEncoding encoding = AudioEncoding::Linear16;
    int sample_rate = 16000;

    bool operator==(const AudioFormat& other) const {
        return encoding == other.encoding && sample_rate == other.sample_rate;
    }
};

struct AudioBuffer {
    AudioFormat format;
    std::string bytes;
};

// Accepts "pcm_16000", "pcm_8000", "ulaw_8000" (and "mulaw_8000").
std::optional<AudioFormat> parse_audio_format(const std::string& name);
std::string to_string(const AudioFormat& format);

}
