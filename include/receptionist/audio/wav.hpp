#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "receptionist/providers/audio_format.hpp"

namespace receptionist::audio {

bool is_wav(const std::string& bytes);

// Walks the RIFF chunks and returns the "data" chunk with the format taken from
// "fmt ". Only PCM16 and mu-law mono payloads are recognized.
std::optional<providers::AudioBuffer> extract_wav_payload(const std::string& bytes);

std::string encode_wav(const std::vector<int16_t>& samples, uint32_t sample_rate);

}
