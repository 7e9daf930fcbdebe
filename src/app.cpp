#include "receptionist/app.hpp"

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>

#include "receptionist/conversation/call_actor.hpp"
#include "receptionist/logging.hpp"
#include "receptionist/providers/audio_format.hpp"
#include "receptionist/utils/http.hpp"

namespace receptionist {

namespace {

std::atomic<bool> signal_received{false};

void on_signal(int) {
    signal_received = true;
}

const char* const kMediaPath = "/realtime/twilio";

std::chrono::milliseconds to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long>(seconds * 1000));
}

std::string media_path_from(const std::string& media_stream_url) {
    if (media_stream_url.empty()) {
        return kMediaPath;
    }
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    utils::parse_url(media_stream_url, scheme, host, port, path);
    path = path.substr(0, path.find('?'));
    return path.empty() || path == "/" ? std::string(kMediaPath) : path;
}

}

ReceptionistApp::ReceptionistApp(Config config) : config_(std::move(config)) {}

ReceptionistApp::~ReceptionistApp() {
    stop();
}

void ReceptionistApp::install_signal_handlers() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

void ReceptionistApp::init() {
    httplib::Headers headers;
    if (config_.authorization_token) {
        headers.emplace("Authorization", "Bearer " + *config_.authorization_token);
    }
    HttpRequestOptions options;
    options.request_timeout = to_ms(config_.backend_request_timeout);
    options.connect_timeout = to_ms(config_.backend_connect_timeout);
    options.read_timeout = to_ms(config_.backend_sock_read_timeout);
    backend_client_ = std::make_shared<HttpClient>(config_.backend_url, headers, options);

    providers_ = providers::build_providers(config_);

    const auto output_format = providers::parse_audio_format(config_.tts_output_format);
    if (!output_format) {
        throw std::runtime_error("Unsupported TTS_OUTPUT_FORMAT: " + config_.tts_output_format);
    }
    tts_cache_ = std::make_shared<tts::TtsCache>(
        std::chrono::milliseconds(config_.tts_cache_ttl_ms),
        static_cast<size_t>(config_.tts_cache_max_entries));
    synthesis_ = std::make_shared<tts::SynthesisChain>(providers_.synthesizers, tts_cache_,
                                                       *output_format);
    if (synthesis_->empty()) {
        logging::warn("No speech synthesizer configured; agent replies will be silent");
    }

    sessions_ = std::make_shared<session::SessionParameterCache>(
        std::chrono::seconds(config_.session_cache_ttl_sec));
    directory_ = std::make_shared<routing::BackendDirectory>(backend_client_);
    routing_ = std::make_shared<routing::RoutingEngine>(directory_);
    completion_ = std::make_shared<conversation::BackendCompletionSink>(backend_client_);

    server::InboundSettings inbound_settings;
    inbound_settings.public_url = config_.server_public_url;
    inbound_settings.media_stream_url = config_.media_stream_url;
    inbound_settings.conversation_enabled = config_.conversation_enabled;
    auto inbound = std::make_shared<server::InboundCallHandler>(routing_, directory_, sessions_,
                                                                inbound_settings);

    media_server_ = std::make_unique<transport::MediaServer>(
        config_.media_port,
        config_.media_threads,
        media_path_from(config_.media_stream_url),
        sessions_,
        [this](const session::SessionParameters& parameters,
               const transport::StartFrame& start,
               std::shared_ptr<transport::MediaSocket> socket) {
            return create_call(parameters, start, std::move(socket));
        });
    rest_server_ = std::make_unique<server::RestServer>(config_.http_port, inbound);

    media_server_->start();
    rest_server_->start();
}

std::shared_ptr<transport::MediaCall> ReceptionistApp::create_call(
    const session::SessionParameters& parameters,
    const transport::StartFrame& start,
    std::shared_ptr<transport::MediaSocket> socket) {
    auto session = conversation::make_call_session(
        parameters, start.stream_sid, static_cast<size_t>(config_.min_ack_variety));

    conversation::CallActorDependencies dependencies;
    dependencies.recognizer = providers_.recognizer;
    dependencies.generator = providers_.generator;
    dependencies.synthesis = synthesis_;
    dependencies.completion = completion_;

    conversation::CallActorSettings settings;
    settings.engine.min_transcript_chars = static_cast<size_t>(config_.min_transcript_chars);
    settings.engine.barge_in_min_chars = static_cast<size_t>(config_.barge_in_min_chars);
    settings.engine.min_caller_turns_before_close =
        static_cast<size_t>(config_.min_caller_turns_before_close);
    settings.ack_delay = std::chrono::milliseconds(config_.ack_delay_ms);
    settings.frame_duration = std::chrono::milliseconds(config_.frame_duration_ms);
    settings.asr_sample_rate = config_.asr_sample_rate;
    settings.asr_language = config_.asr_language;
    settings.tts_max_inflight = config_.tts_max_inflight;
    settings.interruptions_are_allowed = config_.interruptions_are_allowed;

    return std::make_shared<conversation::CallActor>(std::move(session), dependencies, settings,
                                                     std::move(socket));
}

void ReceptionistApp::run() {
    auto next_purge = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (!quitting_ && !signal_received) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() >= next_purge) {
            const auto removed = sessions_ ? sessions_->purge_expired() : 0;
            if (removed > 0) {
                logging::debug(
                    "Expired session parameters purged",
                    {kv("removed", removed)});
            }
            next_purge = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        }
    }
    logging::info("Shutdown requested");
    stop();
}

void ReceptionistApp::stop() {
    quitting_ = true;
    if (rest_server_) {
        rest_server_->stop();
        rest_server_.reset();
    }
    if (media_server_) {
        media_server_->stop();
        media_server_.reset();
    }
}

}
