#include "receptionist/config.hpp"

#include "receptionist/utils/text.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace receptionist {

namespace {

const char* const kVoiceOptions[] = {"koala_warm", "koala_expert", "koala_hype"};

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::string> get_env_first(const char* primary, const char* secondary) {
    if (auto value = get_env_optional(primary)) {
        return value;
    }
    return get_env_optional(secondary);
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const auto value = get_env_optional(name);
    if (!value) {
        return fallback;
    }
    const auto normalized = utils::to_lower(utils::trim(*value));
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

// Numeric variables must parse completely; "20ms" is rejected rather than read as 20.
template <typename T, typename Parse>
T get_env_number(const char* name, T fallback, Parse parse) {
    const auto value = get_env_optional(name);
    if (!value) {
        return fallback;
    }
    size_t consumed = 0;
    T parsed{};
    try {
        parsed = parse(*value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number, got \"" + *value + "\"");
    }
    if (consumed != value->size()) {
        throw std::runtime_error(std::string(name) + " must be a number, got \"" + *value + "\"");
    }
    return parsed;
}

int get_env_int(const char* name, int fallback) {
    return get_env_number<int>(name, fallback, [](const std::string& text, size_t* consumed) {
        return std::stoi(text, consumed);
    });
}

double get_env_double(const char* name, double fallback) {
    return get_env_number<double>(name, fallback, [](const std::string& text, size_t* consumed) {
        return std::stod(text, consumed);
    });
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Values already present in the environment win over the .env file.
void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = utils::trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = utils::trim(line.substr(7));
        }
        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        const auto key = utils::trim(line.substr(0, eq_pos));
        const auto value = strip_quotes(utils::trim(line.substr(eq_pos + 1)));
        if (key.empty()) {
            continue;
        }
        setenv(key.c_str(), value.c_str(), 0);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "receptionist");

    config.http_port = get_env_int("HTTP_PORT", get_env_int("PORT", 8000));
    config.media_port = get_env_int("MEDIA_PORT", 8081);
    config.media_threads = get_env_int("MEDIA_THREADS", 2);
    config.server_public_url = get_env_str("SERVER_PUBLIC_URL", "");
    config.media_stream_url = get_env_str("MEDIA_STREAM_URL", "");
    if (config.media_stream_url.empty() && !config.server_public_url.empty()) {
        auto base = config.server_public_url;
        if (base.rfind("https://", 0) == 0) {
            base = "wss://" + base.substr(8);
        } else if (base.rfind("http://", 0) == 0) {
            base = "ws://" + base.substr(7);
        }
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        config.media_stream_url = base + "/realtime/twilio";
    }

    config.backend_url = get_env_required("BACKEND_URL");
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 10.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 5.0);
    config.backend_sock_read_timeout = get_env_double("BACKEND_SOCK_READ_TIMEOUT", 10.0);

    config.deepgram_api_key = get_env_optional("DEEPGRAM_API_KEY");
    config.deepgram_url = get_env_str("DEEPGRAM_URL", "wss://api.deepgram.com/v1/listen");
    config.deepgram_model = get_env_str("DEEPGRAM_MODEL", "nova-3");
    config.asr_language = get_env_str("ASR_LANGUAGE", "en");
    config.asr_sample_rate = get_env_int("ASR_SAMPLE_RATE", 16000);
    config.asr_endpointing_ms = get_env_int("ASR_ENDPOINTING_MS", 300);
    config.asr_utterance_end_ms = get_env_int("ASR_UTTERANCE_END_MS", 1000);

    config.llm_api_key = get_env_first("LLM_API_KEY", "OPENAI_API_KEY");
    config.llm_base_url = get_env_str("LLM_BASE_URL", "https://api.openai.com/v1");
    config.llm_model = get_env_str("LLM_MODEL", "gpt-4o-mini");
    config.llm_temperature = get_env_double("LLM_TEMPERATURE", 0.7);
    config.llm_max_tokens = get_env_int("LLM_MAX_TOKENS", 80);
    config.llm_timeout_sec = get_env_double("LLM_TIMEOUT_SEC", 20.0);

    if (auto provider = get_env_optional("TTS_PROVIDER")) {
        config.tts_provider = utils::to_lower(utils::trim(*provider));
    }
    config.tts_output_format = get_env_str("TTS_OUTPUT_FORMAT", "pcm_16000");
    config.tts_cache_ttl_ms = get_env_int("TTS_CACHE_TTL_MS", 15 * 60 * 1000);
    config.tts_cache_max_entries = get_env_int("TTS_CACHE_MAX_ENTRIES", 256);
    config.tts_max_inflight = get_env_int("TTS_MAX_INFLIGHT", 2);
    config.tts_timeout_sec = get_env_double("TTS_TIMEOUT_SEC", 15.0);

    config.elevenlabs_api_key = get_env_optional("ELEVENLABS_API_KEY");
    config.elevenlabs_base_url = get_env_str("ELEVENLABS_BASE_URL", "https://api.elevenlabs.io");
    config.elevenlabs_model_id = get_env_str("ELEVENLABS_MODEL_ID", "eleven_multilingual_v2");
    config.elevenlabs_default_voice_id = get_env_optional("ELEVENLABS_DEFAULT_VOICE_ID");

    config.azure_speech_key = get_env_optional("AZURE_SPEECH_KEY");
    config.azure_speech_region = get_env_optional("AZURE_SPEECH_REGION");
    config.azure_speech_endpoint = get_env_optional("AZURE_SPEECH_ENDPOINT");
    config.azure_default_voice = get_env_str("AZURE_TTS_DEFAULT_VOICE", "en-AU-NatashaNeural");

    const std::map<std::string, std::string> azure_defaults = {
        {"koala_warm", "en-AU-NatashaNeural"},
        {"koala_expert", "en-AU-WilliamNeural"},
        {"koala_hype", "en-AU-CarlyNeural"},
    };
    for (const char* option : kVoiceOptions) {
        const auto suffix = to_upper(option);
        const auto eleven_name = "ELEVENLABS_VOICE_" + suffix + "_ID";
        if (auto voice = get_env_optional(eleven_name.c_str())) {
            config.elevenlabs_voices[option] = *voice;
        }
        const auto azure_name = "AZURE_VOICE_" + suffix;
        config.azure_voices[option] = get_env_str(azure_name.c_str(), azure_defaults.at(option));
    }

    config.default_voice_option = get_env_str("DEFAULT_VOICE_OPTION", "koala_warm");
    config.min_ack_variety = get_env_int("MIN_ACK_VARIETY", 3);
    config.ack_delay_ms = get_env_int("ACK_DELAY_MS", 1000);
    config.min_transcript_chars = get_env_int("MIN_TRANSCRIPT_CHARS", 2);
    config.barge_in_min_chars = get_env_int("BARGE_IN_MIN_CHARS", 4);
    config.min_caller_turns_before_close = get_env_int("MIN_CALLER_TURNS_BEFORE_CLOSE", 3);
    config.interruptions_are_allowed = get_env_bool("INTERRUPTIONS_ARE_ALLOWED", false);
    config.frame_duration_ms = get_env_int("FRAME_DURATION_MS", 20);
    config.session_cache_ttl_sec = get_env_int("SESSION_CACHE_TTL_SEC", 300);
    config.conversation_enabled = get_env_bool("ENABLE_CONVERSATION_ORCHESTRATOR", true);

    return config;
}

void Config::validate() const {
    if (backend_url.empty()) {
        throw std::runtime_error("BACKEND_URL is required");
    }
    if (http_port <= 0) {
        throw std::runtime_error("HTTP_PORT must be positive");
    }
    if (media_port <= 0) {
        throw std::runtime_error("MEDIA_PORT must be positive");
    }
    if (media_threads <= 0) {
        throw std::runtime_error("MEDIA_THREADS must be positive");
    }
    if (conversation_enabled && media_stream_url.empty()) {
        throw std::runtime_error("MEDIA_STREAM_URL or SERVER_PUBLIC_URL is required");
    }
    if (asr_sample_rate != 8000 && asr_sample_rate != 16000) {
        throw std::runtime_error("ASR_SAMPLE_RATE must be 8000 or 16000");
    }
    if (tts_cache_ttl_ms <= 0) {
        throw std::runtime_error("TTS_CACHE_TTL_MS must be positive");
    }
    if (tts_cache_max_entries <= 0) {
        throw std::runtime_error("TTS_CACHE_MAX_ENTRIES must be positive");
    }
    if (tts_max_inflight <= 0) {
        throw std::runtime_error("TTS_MAX_INFLIGHT must be positive");
    }
    if (min_ack_variety < 1) {
        throw std::runtime_error("MIN_ACK_VARIETY must be positive");
    }
    if (ack_delay_ms < 0) {
        throw std::runtime_error("ACK_DELAY_MS must be zero or positive");
    }
    if (frame_duration_ms <= 0 || frame_duration_ms % 10 != 0) {
        throw std::runtime_error("FRAME_DURATION_MS must be a positive multiple of 10");
    }
    if (session_cache_ttl_sec <= 0) {
        throw std::runtime_error("SESSION_CACHE_TTL_SEC must be positive");
    }
}

}
