#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace receptionist {

struct Config {
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "receptionist";

    int http_port = 8000;
    int media_port = 8081;
    int media_threads = 2;
    std::string server_public_url;
    std::string media_stream_url;

    std::string backend_url;
    std::optional<std::string> authorization_token;
    double backend_request_timeout = 10.0;
    double backend_connect_timeout = 5.0;
    double backend_sock_read_timeout = 10.0;

    std::optional<std::string> deepgram_api_key;
    std::string deepgram_url = "wss://api.deepgram.com/v1/listen";
    std::string deepgram_model = "nova-3";
    std::string asr_language = "en";
    int asr_sample_rate = 16000;
    int asr_endpointing_ms = 300;
    int asr_utterance_end_ms = 1000;

    std::optional<std::string> llm_api_key;
    std::string llm_base_url = "https://api.openai.com/v1";
    std::string llm_model = "gpt-4o-mini";
    double llm_temperature = 0.7;
    int llm_max_tokens = 80;
    double llm_timeout_sec = 20.0;

    std::optional<std::string> tts_provider;
    std::string tts_output_format = "pcm_16000";
    int tts_cache_ttl_ms = 15 * 60 * 1000;
    int tts_cache_max_entries = 256;
    int tts_max_inflight = 2;
    double tts_timeout_sec = 15.0;

    std::optional<std::string> elevenlabs_api_key;
    std::string elevenlabs_base_url = "https://api.elevenlabs.io";
    std::string elevenlabs_model_id = "eleven_multilingual_v2";
    std::optional<std::string> elevenlabs_default_voice_id;
    std::map<std::string, std::string> elevenlabs_voices;

    std::optional<std::string> azure_speech_key;
    std::optional<std::string> azure_speech_region;
    std::optional<std::string> azure_speech_endpoint;
    std::string azure_default_voice = "en-AU-NatashaNeural";
    std::map<std::string, std::string> azure_voices;

    std::string default_voice_option = "koala_warm";
    int min_ack_variety = 3;
    int ack_delay_ms = 1000;
    int min_transcript_chars = 2;
    int barge_in_min_chars = 4;
    int min_caller_turns_before_close = 3;
    bool interruptions_are_allowed = false;
    int frame_duration_ms = 20;
    int session_cache_ttl_sec = 300;
    bool conversation_enabled = true;

    static Config load();
    void validate() const;
};

}
