#include <catch2/catch_test_macros.hpp>

#include "receptionist/transport/media_frames.hpp"

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

#include <string>
#include <variant>

using namespace receptionist::transport;

TEST_CASE("start frames carry the call sid and custom parameters") {
    const auto frame = parse_frame(R"({
        "event": "start",
        "sequenceNumber": "1",
        "start": {
            "streamSid": "MZ123",
            "accountSid": "AC9",
            "callSid": "CA42",
            "tracks": ["inbound"],
            "customParameters": {"callSid": "CA42", "userId": "acct-1", "retries": 2},
            "mediaFormat": {"encoding": "audio/x-mulaw", "sampleRate": 8000, "channels": 1}
        },
        "streamSid": "MZ123"
    })");
    const auto* start = std::get_if<StartFrame>(&frame);
    REQUIRE(start);
    REQUIRE(start->stream_sid == "MZ123");
    REQUIRE(start->call_sid == "CA42");
    REQUIRE(start->account_sid == "AC9");
    REQUIRE(start->custom_parameters.at("userId") == "acct-1");
    REQUIRE(start->custom_parameters.at("retries") == "2");
    REQUIRE(start->sample_rate == 8000);
}

TEST_CASE("media frames decode their payload and counters") {
    const std::string audio("\xFF\x7F\x00\x10", 4);
    const nlohmann::json message = {
        {"event", "media"},
        {"streamSid", "MZ123"},
        {"media",
         {{"track", "inbound"},
          {"chunk", "3"},
          {"timestamp", 60},
          {"payload", websocketpp::base64_encode(audio)}}},
    };
    const auto frame = parse_frame(message.dump());
    const auto* media = std::get_if<MediaFrame>(&frame);
    REQUIRE(media);
    REQUIRE(media->payload == audio);
    REQUIRE(media->chunk == 3);
    REQUIRE(media->timestamp_ms == 60);
    REQUIRE(media->track == "inbound");
}

TEST_CASE("stop mark and connected frames are recognized") {
    const auto stop = parse_frame(R"({"event":"stop","streamSid":"MZ1","stop":{"callSid":"CA1"}})");
    REQUIRE(std::get<StopFrame>(stop).call_sid == "CA1");

    const auto mark = parse_frame(R"({"event":"mark","streamSid":"MZ1","mark":{"name":"utterance-4"}})");
    REQUIRE(std::get<MarkFrame>(mark).name == "utterance-4");

    const auto connected = parse_frame(R"({"event":"connected","protocol":"Call"})");
    REQUIRE(std::get<ConnectedFrame>(connected).protocol == "Call");

    const auto dtmf = parse_frame(R"({"event":"dtmf","dtmf":{"digit":"1"}})");
    REQUIRE(std::get<UnknownFrame>(dtmf).event == "dtmf");
}

TEST_CASE("malformed frames never throw") {
    REQUIRE(std::holds_alternative<MalformedFrame>(parse_frame("not json")));
    REQUIRE(std::holds_alternative<MalformedFrame>(parse_frame("[1,2,3]")));
    REQUIRE(std::holds_alternative<MalformedFrame>(parse_frame(R"({"streamSid":"MZ1"})")));
    REQUIRE(std::holds_alternative<MalformedFrame>(parse_frame(R"({"event":"media"})")));
    REQUIRE(std::holds_alternative<MalformedFrame>(
        parse_frame(R"({"event":"media","media":{"payload":42}})")));
}

TEST_CASE("outbound frames follow the provider wire format") {
    const auto media = nlohmann::json::parse(build_media_frame("MZ1", std::string(3, '\xFF')));
    REQUIRE(media["event"] == "media");
    REQUIRE(media["streamSid"] == "MZ1");
    REQUIRE(websocketpp::base64_decode(media["media"]["payload"].get<std::string>()) ==
            std::string(3, '\xFF'));

    const auto mark = nlohmann::json::parse(build_mark_frame("MZ1", "utterance-2"));
    REQUIRE(mark["event"] == "mark");
    REQUIRE(mark["mark"]["name"] == "utterance-2");

    const auto clear = nlohmann::json::parse(build_clear_frame("MZ1"));
    REQUIRE(clear == nlohmann::json({{"event", "clear"}, {"streamSid", "MZ1"}}));
}
