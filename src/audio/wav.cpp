#include "receptionist/audio/wav.hpp"

#include <algorithm>

namespace receptionist::audio {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatMulaw = 7;

uint16_t read_u16(const std::string& bytes, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(bytes[offset]) |
                                 (static_cast<uint8_t>(bytes[offset + 1]) << 8));
}

uint32_t read_u32(const std::string& bytes, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 3])) << 24);
}

}

bool is_wav(const std::string& bytes) {
    return bytes.size() >= 12 && bytes.compare(0, 4, "RIFF") == 0 &&
           bytes.compare(8, 4, "WAVE") == 0;
}

std::optional<providers::AudioBuffer> extract_wav_payload(const std::string& bytes) {
    if (!is_wav(bytes)) {
        return std::nullopt;
    }
    std::optional<providers::AudioFormat> format;
    size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const auto chunk_id = bytes.substr(offset, 4);
        const auto chunk_size = read_u32(bytes, offset + 4);
        const size_t body = offset + 8;
        if (chunk_id == "fmt ") {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                return std::nullopt;
            }
            const auto audio_format = read_u16(bytes, body);
            const auto channels = read_u16(bytes, body + 2);
            const auto sample_rate = read_u32(bytes, body + 4);
            const auto bits = read_u16(bytes, body + 14);
            if (channels != 1) {
                return std::nullopt;
            }
            if (audio_format == kFormatPcm && bits == 16) {
                format = providers::AudioFormat{providers::AudioEncoding::Linear16,
                                                static_cast<int>(sample_rate)};
            } else if (audio_format == kFormatMulaw && bits == 8) {
                format = providers::AudioFormat{providers::AudioEncoding::Mulaw,
                                                static_cast<int>(sample_rate)};
            } else {
                return std::nullopt;
            }
        } else if (chunk_id == "data") {
            if (!format) {
                return std::nullopt;
            }
            // Streaming encoders write 0 or 0xFFFFFFFF when the length is unknown.
            const size_t available = bytes.size() - body;
            const size_t length = (chunk_size == 0 || chunk_size == 0xFFFFFFFFu)
                                      ? available
                                      : std::min<size_t>(chunk_size, available);
            return providers::AudioBuffer{*format, bytes.substr(body, length)};
        }
        offset = body + chunk_size + (chunk_size & 1u);
    }
    return std::nullopt;
}

std::string encode_wav(const std::vector<int16_t>& samples, uint32_t sample_rate) {
    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    const uint16_t block_align = channels * (bits_per_sample / 8);
    const uint32_t byte_rate = sample_rate * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::string result;
    result.reserve(44 + data_size);
    auto append_u16 = [&result](uint16_t value) {
        result.push_back(static_cast<char>(value & 0xFF));
        result.push_back(static_cast<char>((value >> 8) & 0xFF));
    };
    auto append_u32 = [&result](uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            result.push_back(static_cast<char>((value >> shift) & 0xFF));
        }
    };

    result.append("RIFF", 4);
    append_u32(36 + data_size);
    result.append("WAVE", 4);
    result.append("fmt ", 4);
    append_u32(16);
    append_u16(kFormatPcm);
    append_u16(channels);
    append_u32(sample_rate);
    append_u32(byte_rate);
    append_u16(block_align);
    append_u16(bits_per_sample);
    result.append("data", 4);
    append_u32(data_size);
    for (const auto sample : samples) {
        append_u16(static_cast<uint16_t>(sample));
    }
    return result;
}

}
