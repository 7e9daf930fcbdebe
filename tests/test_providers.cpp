#include <catch2/catch_test_macros.hpp>

#include "receptionist/providers/azure_synthesizer.hpp"
#include "receptionist/providers/openai_generator.hpp"
#include "receptionist/providers/registry.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

using namespace receptionist::providers;

TEST_CASE("completion payloads include the prompt history and the extraction tool") {
    OpenAiSettings settings;
    GenerationRequest request;
    request.system_prompt = "You are a receptionist.";
    request.messages = {{"assistant", "Hi, what can we help with?"}, {"user", "A leaking tap."}};

    const auto payload = OpenAiGenerator::build_payload(settings, request);
    REQUIRE(payload["model"] == "gpt-4o-mini");
    REQUIRE(payload["messages"].size() == 3);
    REQUIRE(payload["messages"][0]["role"] == "system");
    REQUIRE(payload["messages"][2]["content"] == "A leaking tap.");
    REQUIRE(payload["tools"][0]["function"]["name"] == "extract_booking_details");
    REQUIRE(payload["tool_choice"] == "auto");

    request.allow_function_calls = false;
    const auto plain = OpenAiGenerator::build_payload(settings, request);
    REQUIRE_FALSE(plain.contains("tools"));
}

TEST_CASE("plain completions become assistant utterances") {
    const nlohmann::json response = {
        {"choices", {{{"message", {{"role", "assistant"}, {"content", "What suburb?"}}}}}},
    };
    const auto result = OpenAiGenerator::parse_response(response);
    REQUIRE(std::get<AssistantUtterance>(result).text == "What suburb?");
}

TEST_CASE("tool calls become function calls with parsed arguments") {
    const nlohmann::json response = {
        {"choices",
         {{{"message",
            {{"role", "assistant"},
             {"content", "Thanks Sam."},
             {"tool_calls",
              {{{"id", "call_1"},
                {"type", "function"},
                {"function",
                 {{"name", "extract_booking_details"},
                  {"arguments", R"({"caller_name":"Sam","urgency":"urgent"})"}}}}}}}}}}},
    };
    const auto result = OpenAiGenerator::parse_response(response);
    const auto& call = std::get<FunctionCall>(result);
    REQUIRE(call.name == "extract_booking_details");
    REQUIRE(call.spoken_text == "Thanks Sam.");
    REQUIRE(call.arguments["caller_name"] == "Sam");
    REQUIRE(call.arguments["urgency"] == "urgent");
}

TEST_CASE("unusable completions are reported as generation failures") {
    REQUIRE_THROWS_AS(OpenAiGenerator::parse_response(nlohmann::json::object()),
                      GenerationFailure);
    const nlohmann::json empty = {{"choices", {{{"message", {{"content", nullptr}}}}}}};
    REQUIRE_THROWS_AS(OpenAiGenerator::parse_response(empty), GenerationFailure);
}

TEST_CASE("ssml escapes the text and names the voice") {
    const auto ssml = AzureSynthesizer::build_ssml("Tom & Jerry <3", "en-AU-NatashaNeural", "en-AU");
    REQUIRE(ssml == "<speak version=\"1.0\" xml:lang=\"en-AU\">"
                    "<voice name=\"en-AU-NatashaNeural\">Tom &amp; Jerry &lt;3</voice></speak>");
}

TEST_CASE("azure output formats map from the requested audio format") {
    REQUIRE(AzureSynthesizer::output_format_header({AudioEncoding::Mulaw, 8000}) ==
            std::optional<std::string>("raw-8khz-8bit-mono-mulaw"));
    REQUIRE(AzureSynthesizer::output_format_header({AudioEncoding::Linear16, 16000}) ==
            std::optional<std::string>("riff-16khz-16bit-mono-pcm"));
    REQUIRE_FALSE(AzureSynthesizer::output_format_header({AudioEncoding::Linear16, 44100}));
}

TEST_CASE("audio format names parse to encodings") {
    const auto pcm = parse_audio_format("pcm_16000");
    REQUIRE(pcm);
    REQUIRE(pcm->encoding == AudioEncoding::Linear16);
    REQUIRE(pcm->sample_rate == 16000);
    const auto mulaw = parse_audio_format("ulaw_8000");
    REQUIRE(mulaw);
    REQUIRE(mulaw->encoding == AudioEncoding::Mulaw);
    REQUIRE(to_string(*mulaw) == "ulaw_8000");
    REQUIRE_FALSE(parse_audio_format("mp3_44100_128"));
}

TEST_CASE("synthesis priority puts the configured preference first") {
    REQUIRE(resolve_synthesis_priority(std::nullopt, true, true) ==
            std::vector<std::string>{"azure", "elevenlabs"});
    REQUIRE(resolve_synthesis_priority(std::string("elevenlabs"), true, true) ==
            std::vector<std::string>{"elevenlabs", "azure"});
    REQUIRE(resolve_synthesis_priority(std::string("azure"), false, true) ==
            std::vector<std::string>{"elevenlabs"});
    REQUIRE(resolve_synthesis_priority(std::nullopt, false, false).empty());
}

TEST_CASE("voice catalogs resolve custom voices presets and defaults") {
    VoiceCatalog catalog;
    catalog.presets = {{"koala_warm", "voice-koala"}};
    catalog.default_voice = "voice-default";

    VoiceSelection selection;
    REQUIRE(catalog.resolve(selection) == std::optional<std::string>("voice-koala"));

    selection.preset = "unknown";
    REQUIRE(catalog.resolve(selection) == std::optional<std::string>("voice-default"));

    selection.custom_voice_id = "custom-1";
    REQUIRE(catalog.resolve(selection) == std::optional<std::string>("voice-default"));
    catalog.accepts_custom_voice = true;
    REQUIRE(catalog.resolve(selection) == std::optional<std::string>("custom-1"));

    VoiceCatalog empty;
    REQUIRE_FALSE(empty.resolve(VoiceSelection{"unknown", std::nullopt}));
}
