#include "receptionist/audio/codec.hpp"

#include <algorithm>
#include <cmath>

namespace receptionist::audio {

namespace {

constexpr int kMulawBias = 0x84;
constexpr int kMulawClip = 32635;

}

uint8_t encode_mulaw(int16_t sample) {
    int value = sample;
    const int sign = value < 0 ? 0x80 : 0x00;
    if (value < 0) {
        value = -value;
    }
    value = std::min(value, kMulawClip);
    value += kMulawBias;

    int exponent = 7;
    for (int mask = 0x4000; (value & mask) == 0 && exponent > 0; mask >>= 1) {
        --exponent;
    }
    const int mantissa = (value >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

int16_t decode_mulaw(uint8_t code) {
    const int inverted = static_cast<uint8_t>(~code);
    const int sign = inverted & 0x80;
    const int exponent = (inverted >> 4) & 0x07;
    const int mantissa = inverted & 0x0F;
    const int magnitude = (((mantissa << 3) + kMulawBias) << exponent) - kMulawBias;
    return static_cast<int16_t>(sign ? -magnitude : magnitude);
}

std::string encode_mulaw(const std::vector<int16_t>& samples) {
    std::string out;
    out.resize(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        out[i] = static_cast<char>(encode_mulaw(samples[i]));
    }
    return out;
}

std::vector<int16_t> decode_mulaw(const std::string& bytes) {
    std::vector<int16_t> out;
    out.reserve(bytes.size());
    for (unsigned char byte : bytes) {
        out.push_back(decode_mulaw(byte));
    }
    return out;
}

std::vector<int16_t> pcm16_from_bytes(const std::string& bytes) {
    std::vector<int16_t> out(bytes.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        const auto lo = static_cast<uint8_t>(bytes[2 * i]);
        const auto hi = static_cast<uint8_t>(bytes[2 * i + 1]);
        out[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return out;
}

std::string pcm16_to_bytes(const std::vector<int16_t>& samples) {
    std::string out;
    out.resize(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto value = static_cast<uint16_t>(samples[i]);
        out[2 * i] = static_cast<char>(value & 0xFF);
        out[2 * i + 1] = static_cast<char>((value >> 8) & 0xFF);
    }
    return out;
}

std::vector<int16_t> downsample_2x(const std::vector<int16_t>& samples) {
    std::vector<int16_t> out;
    out.reserve(samples.size() / 2);
    for (size_t i = 0; i + 1 < samples.size(); i += 2) {
        out.push_back(samples[i]);
    }
    return out;
}

std::vector<int16_t> upsample_2x(const std::vector<int16_t>& samples) {
    std::vector<int16_t> out;
    out.reserve(samples.size() * 2);
    for (const auto sample : samples) {
        out.push_back(sample);
        out.push_back(sample);
    }
    return out;
}

double compute_rms(const std::vector<int16_t>& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto sample : samples) {
        const double value = sample;
        sum += value * value;
    }
    const double rms = std::sqrt(sum / static_cast<double>(samples.size())) / 32767.0;
    return std::min(rms, 1.0);
}

std::optional<std::string> to_transport(const providers::AudioBuffer& buffer) {
    const auto& format = buffer.format;
    if (format.encoding == providers::AudioEncoding::Mulaw) {
        if (format.sample_rate != kTransportSampleRate) {
            return std::nullopt;
        }
        return buffer.bytes;
    }
    auto samples = pcm16_from_bytes(buffer.bytes);
    if (format.sample_rate == 16000) {
        samples = downsample_2x(samples);
    } else if (format.sample_rate != kTransportSampleRate) {
        return std::nullopt;
    }
    return encode_mulaw(samples);
}

std::optional<std::string> from_transport(const std::string& mulaw, int target_rate) {
    auto samples = decode_mulaw(mulaw);
    if (target_rate == 16000) {
        samples = upsample_2x(samples);
    } else if (target_rate != kTransportSampleRate) {
        return std::nullopt;
    }
    return pcm16_to_bytes(samples);
}

}
