#include <catch2/catch_test_macros.hpp>

#include "receptionist/server/twiml.hpp"

#include <string>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}

TEST_CASE("voicemail markup records after the greeting") {
    const auto xml = receptionist::server::voicemail_twiml(
        "Acme & Sons can't take your call.", "https://rx.example.com/telephony/recording-complete");
    REQUIRE(xml.rfind("<?xml", 0) == 0);
    REQUIRE(contains(xml, "<Say>Acme &amp; Sons can&apos;t take your call.</Say>"));
    REQUIRE(contains(xml, "<Record action=\"https://rx.example.com/telephony/recording-complete\""));
    REQUIRE(contains(xml, "maxLength=\"120\""));

    const auto fallback = receptionist::server::voicemail_twiml("  ", "/rec");
    REQUIRE(contains(fallback, "leave your name, number and a short message"));
}

TEST_CASE("hybrid choice gathers one digit or speech and falls back to voicemail") {
    const auto xml = receptionist::server::hybrid_choice_twiml(
        "Hi from Acme.", "https://rx/telephony/inbound-voice?stage=choice",
        "https://rx/telephony/inbound-voice?stage=choice&decision=voicemail");
    REQUIRE(contains(xml, "<Gather input=\"speech dtmf\""));
    REQUIRE(contains(xml, "action=\"https://rx/telephony/inbound-voice?stage=choice\""));
    REQUIRE(contains(xml, "numDigits=\"1\""));
    REQUIRE(contains(xml, "<Say>Hi from Acme.</Say>"));
    REQUIRE(contains(xml, "press 1"));
    REQUIRE(contains(xml, "press 2"));
    REQUIRE(contains(xml, "<Redirect method=\"POST\">"
                          "https://rx/telephony/inbound-voice?stage=choice&amp;decision=voicemail"
                          "</Redirect>"));
}

TEST_CASE("connect markup streams to the media url with call parameters") {
    const auto xml = receptionist::server::connect_stream_twiml(
        "wss://rx.example.com/realtime/twilio", "CA123", "acct-1");
    REQUIRE(contains(xml, "<Connect><Stream url=\"wss://rx.example.com/realtime/twilio?callSid=CA123\""));
    REQUIRE(contains(xml, "<Parameter name=\"callSid\" value=\"CA123\"/>"));
    REQUIRE(contains(xml, "<Parameter name=\"userId\" value=\"acct-1\"/>"));

    const auto with_query = receptionist::server::connect_stream_twiml(
        "wss://rx.example.com/realtime/twilio?region=au", "CA1", "acct-1");
    REQUIRE(contains(with_query, "?region=au&amp;callSid=CA1"));
}

TEST_CASE("recording completion thanks the caller and hangs up") {
    const auto xml = receptionist::server::recording_complete_twiml();
    REQUIRE(contains(xml, "<Hangup/>"));
}

TEST_CASE("hybrid choices prefer digits over speech") {
    using receptionist::server::HybridChoice;
    using receptionist::server::interpret_hybrid_choice;
    REQUIRE(interpret_hybrid_choice("1", "talk to the receptionist") == HybridChoice::Voicemail);
    REQUIRE(interpret_hybrid_choice("2", "leave a message") == HybridChoice::Receptionist);
    REQUIRE(interpret_hybrid_choice("", "I'd like to Leave a Message") == HybridChoice::Voicemail);
    REQUIRE(interpret_hybrid_choice("", "voicemail please") == HybridChoice::Voicemail);
    REQUIRE(interpret_hybrid_choice("", "talk to someone") == HybridChoice::Receptionist);
    REQUIRE(interpret_hybrid_choice("9", "") == HybridChoice::Receptionist);
}
