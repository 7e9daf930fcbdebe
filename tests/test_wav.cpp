#include <catch2/catch_test_macros.hpp>

#include "receptionist/audio/codec.hpp"
#include "receptionist/audio/wav.hpp"

#include <string>
#include <vector>

TEST_CASE("encode_wav produces a readable PCM envelope") {
    const std::vector<int16_t> samples = {0, 100, -100, 32767};
    const auto wav = receptionist::audio::encode_wav(samples, 16000);
    REQUIRE(wav.size() == 44 + samples.size() * 2);
    REQUIRE(receptionist::audio::is_wav(wav));

    const auto payload = receptionist::audio::extract_wav_payload(wav);
    REQUIRE(payload);
    REQUIRE(payload->format.encoding == receptionist::providers::AudioEncoding::Linear16);
    REQUIRE(payload->format.sample_rate == 16000);
    REQUIRE(receptionist::audio::pcm16_from_bytes(payload->bytes) == samples);
}

TEST_CASE("extract_wav_payload takes the rest of the buffer for streaming sizes") {
    const std::vector<int16_t> samples(80, 42);
    auto wav = receptionist::audio::encode_wav(samples, 8000);
    // Overwrite the data chunk size with the unknown-length marker.
    for (size_t i = 40; i < 44; ++i) {
        wav[i] = '\xFF';
    }
    const auto payload = receptionist::audio::extract_wav_payload(wav);
    REQUIRE(payload);
    REQUIRE(payload->bytes.size() == samples.size() * 2);
}

TEST_CASE("extract_wav_payload rejects non-wav and stereo input") {
    REQUIRE_FALSE(receptionist::audio::is_wav("not a wav file"));
    REQUIRE_FALSE(receptionist::audio::extract_wav_payload("not a wav file"));

    auto wav = receptionist::audio::encode_wav({1, 2, 3, 4}, 8000);
    wav[22] = 2;
    REQUIRE_FALSE(receptionist::audio::extract_wav_payload(wav));
}
