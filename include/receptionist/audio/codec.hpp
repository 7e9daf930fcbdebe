#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "receptionist/providers/audio_format.hpp"

namespace receptionist::audio {

constexpr int kTransportSampleRate = 8000;

// G.711 mu-law companding.
uint8_t encode_mulaw(int16_t sample);
int16_t decode_mulaw(uint8_t code);

std::string encode_mulaw(const std::vector<int16_t>& samples);
std::vector<int16_t> decode_mulaw(const std::string& bytes);

// Little-endian 16-bit PCM. A trailing odd byte is dropped.
std::vector<int16_t> pcm16_from_bytes(const std::string& bytes);
std::string pcm16_to_bytes(const std::vector<int16_t>& samples);

// Naive rate conversion: decimation keeps even-index samples, duplication
// repeats each sample.
std::vector<int16_t> downsample_2x(const std::vector<int16_t>& samples);
std::vector<int16_t> upsample_2x(const std::vector<int16_t>& samples);

// Root mean square normalized to [0, 1]; 0 for an empty buffer.
double compute_rms(const std::vector<int16_t>& samples);

// Provider audio to 8 kHz mu-law bytes. nullopt for formats with no conversion path.
std::optional<std::string> to_transport(const providers::AudioBuffer& buffer);

// 8 kHz mu-law bytes to little-endian linear PCM at target_rate (8000 or 16000).
std::optional<std::string> from_transport(const std::string& mulaw, int target_rate);

}
