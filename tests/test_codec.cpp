#include <catch2/catch_test_macros.hpp>

#include "receptionist/audio/codec.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using receptionist::audio::decode_mulaw;
using receptionist::audio::encode_mulaw;

TEST_CASE("mu-law silence encodes to 0xFF and decodes to zero") {
    REQUIRE(encode_mulaw(static_cast<int16_t>(0)) == 0xFF);
    REQUIRE(decode_mulaw(static_cast<uint8_t>(0xFF)) == 0);
}

TEST_CASE("mu-law round trip stays within one quantization step") {
    for (int value = -32768; value <= 32767; value += 97) {
        const auto sample = static_cast<int16_t>(value);
        const int decoded = decode_mulaw(encode_mulaw(sample));
        const int clipped = std::min(std::abs(value), 32635);
        const int step = (clipped + 0x84) / 16 + 1;
        REQUIRE(std::abs(std::abs(decoded) - clipped) <= step);
        if (value > 0) {
            REQUIRE(decoded >= 0);
        } else if (value < 0) {
            REQUIRE(decoded <= 0);
        }
    }
}

TEST_CASE("mu-law encoding is monotonic in magnitude") {
    int previous = decode_mulaw(encode_mulaw(static_cast<int16_t>(0)));
    for (int value = 0; value <= 32767; value += 50) {
        const int decoded = decode_mulaw(encode_mulaw(static_cast<int16_t>(value)));
        REQUIRE(decoded >= previous);
        previous = decoded;
    }
}

TEST_CASE("decoding then encoding a mu-law byte is stable") {
    for (int code = 0; code < 256; ++code) {
        const auto byte = static_cast<uint8_t>(code);
        const auto reencoded = encode_mulaw(decode_mulaw(byte));
        // 0x7F is negative zero and collapses onto positive zero.
        if (code == 0x7F) {
            REQUIRE(reencoded == 0xFF);
        } else {
            REQUIRE(reencoded == byte);
        }
    }
}

TEST_CASE("pcm16 bytes are little endian and drop a trailing odd byte") {
    const std::vector<int16_t> samples = {1, -2, 0x1234};
    const auto bytes = receptionist::audio::pcm16_to_bytes(samples);
    REQUIRE(bytes.size() == 6);
    REQUIRE(static_cast<uint8_t>(bytes[4]) == 0x34);
    REQUIRE(static_cast<uint8_t>(bytes[5]) == 0x12);
    REQUIRE(receptionist::audio::pcm16_from_bytes(bytes + "x") == samples);
}

TEST_CASE("downsample keeps even samples and upsample repeats") {
    const std::vector<int16_t> samples = {10, 20, 30, 40};
    REQUIRE(receptionist::audio::downsample_2x(samples) == std::vector<int16_t>{10, 30});
    REQUIRE(receptionist::audio::upsample_2x({7, 9}) == std::vector<int16_t>{7, 7, 9, 9});
    REQUIRE(receptionist::audio::downsample_2x(receptionist::audio::upsample_2x(samples)) ==
            samples);
}

TEST_CASE("compute_rms is normalized") {
    REQUIRE(receptionist::audio::compute_rms({}) == 0.0);
    REQUIRE(receptionist::audio::compute_rms({0, 0, 0}) == 0.0);
    const double full = receptionist::audio::compute_rms({32767, -32767});
    REQUIRE(full > 0.999);
    REQUIRE(full <= 1.0);
}

TEST_CASE("to_transport converts 16 kHz linear audio to 8 kHz mu-law") {
    receptionist::providers::AudioBuffer buffer;
    buffer.format = {receptionist::providers::AudioEncoding::Linear16, 16000};
    buffer.bytes = receptionist::audio::pcm16_to_bytes(std::vector<int16_t>(320, 1000));
    const auto transport = receptionist::audio::to_transport(buffer);
    REQUIRE(transport);
    REQUIRE(transport->size() == 160);
    REQUIRE(static_cast<uint8_t>((*transport)[0]) == encode_mulaw(static_cast<int16_t>(1000)));
}

TEST_CASE("to_transport passes 8 kHz mu-law through and rejects other rates") {
    receptionist::providers::AudioBuffer buffer;
    buffer.format = {receptionist::providers::AudioEncoding::Mulaw, 8000};
    buffer.bytes = std::string(160, '\xFF');
    REQUIRE(receptionist::audio::to_transport(buffer) == buffer.bytes);

    buffer.format = {receptionist::providers::AudioEncoding::Linear16, 22050};
    REQUIRE_FALSE(receptionist::audio::to_transport(buffer));
}

TEST_CASE("from_transport produces linear PCM at the recognizer rate") {
    const std::string mulaw(160, '\xFF');
    const auto narrow = receptionist::audio::from_transport(mulaw, 8000);
    const auto wide = receptionist::audio::from_transport(mulaw, 16000);
    REQUIRE(narrow);
    REQUIRE(wide);
    REQUIRE(narrow->size() == 320);
    REQUIRE(wide->size() == 640);
    REQUIRE_FALSE(receptionist::audio::from_transport(mulaw, 44100));
}
