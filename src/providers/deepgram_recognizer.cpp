#include "receptionist/providers/deepgram_recognizer.hpp"

#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

#include <openssl/ssl.h>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "receptionist/logging.hpp"
#include "receptionist/utils/channel.hpp"
#include "receptionist/utils/http.hpp"

namespace receptionist::providers {

namespace {

using PlainClient = websocketpp::client<websocketpp::config::asio_client>;
using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = websocketpp::lib::asio::ssl::context;
using TlsSocket = websocketpp::lib::asio::ssl::stream<websocketpp::lib::asio::ip::tcp::socket>;

constexpr size_t kMaxBacklogChunks = 150;
constexpr auto kCloseGrace = std::chrono::seconds(2);

std::string append_segment(const std::string& base, const std::string& segment) {
    if (base.empty()) {
        return segment;
    }
    if (segment.empty()) {
        return base;
    }
    return base + " " + segment;
}

template <typename Client>
class DeepgramStream : public RecognitionStream {
public:
    DeepgramStream(const std::string& url,
                   const std::string& api_key,
                   std::string call_sid,
                   std::chrono::milliseconds keepalive_interval)
        : call_sid_(std::move(call_sid)),
          keepalive_interval_(keepalive_interval) {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();

        if constexpr (std::is_same_v<Client, TlsClient>) {
            std::string scheme;
            std::string host;
            std::string path;
            int port = 0;
            utils::parse_url(url, scheme, host, port, path);
            client_.set_tls_init_handler([](websocketpp::connection_hdl) {
                auto context = websocketpp::lib::make_shared<SslContext>(
                    SslContext::tlsv12_client);
                context->set_default_verify_paths();
                context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
                return context;
            });
            client_.set_socket_init_handler([host](websocketpp::connection_hdl,
                                                   TlsSocket& socket) {
                SSL_set_tlsext_host_name(socket.native_handle(), host.c_str());
            });
        }

        client_.set_open_handler([this](websocketpp::connection_hdl) { on_open(); });
        client_.set_message_handler([this](websocketpp::connection_hdl,
                                           typename Client::message_ptr message) {
            on_message(message->get_payload());
        });
        client_.set_close_handler([this](websocketpp::connection_hdl) { on_closed("closed"); });
        client_.set_fail_handler([this](websocketpp::connection_hdl hdl) {
            websocketpp::lib::error_code ec;
            auto connection = client_.get_con_from_hdl(hdl, ec);
            on_closed(connection ? connection->get_ec().message() : "connect failed");
        });

        websocketpp::lib::error_code ec;
        auto connection = client_.get_connection(url, ec);
        if (ec) {
            throw RecognitionFailure("Deepgram connection setup failed: " + ec.message());
        }
        connection->append_header("Authorization", "Token " + api_key);
        connection_ = connection->get_handle();
        client_.connect(connection);

        auto done = std::make_shared<std::promise<void>>();
        finished_running_ = done->get_future();
        worker_ = std::thread([this, done]() {
            try {
                client_.run();
            } catch (const std::exception& ex) {
                logging::error(
                    "Deepgram event loop failed",
                    {kv("call_sid", call_sid_),
                     kv("error", ex.what())});
            }
            events_.close();
            done->set_value();
        });
    }

    ~DeepgramStream() override {
        close();
    }

    void send_audio(const std::string& pcm) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || finished_) {
            return;
        }
        if (!open_) {
            if (backlog_.size() < kMaxBacklogChunks) {
                backlog_.push_back(pcm);
            }
            return;
        }
        send_locked(pcm, websocketpp::frame::opcode::binary);
        last_audio_ = std::chrono::steady_clock::now();
    }

    void finish() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || finished_) {
            return;
        }
        finished_ = true;
        if (open_) {
            send_locked(R"({"type":"CloseStream"})", websocketpp::frame::opcode::text);
        }
    }

    void close() override {
        bool first_close = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                closed_ = true;
                first_close = true;
                if (keepalive_timer_) {
                    keepalive_timer_->cancel();
                }
            }
        }
        if (first_close) {
            // Handlers may run synchronously inside close(), so no lock is held here.
            websocketpp::lib::error_code ec;
            client_.close(connection_, websocketpp::close::status::normal, "call ended", ec);
            if (ec) {
                logging::debug(
                    "Deepgram close skipped",
                    {kv("call_sid", call_sid_),
                     kv("error", ec.message())});
            }
        }
        events_.close();
        if (!worker_.joinable()) {
            return;
        }
        if (finished_running_.wait_for(kCloseGrace) != std::future_status::ready) {
            client_.stop();
        }
        worker_.join();
    }

    std::optional<TranscriptEvent> next_event() override {
        return events_.pop();
    }

private:
    void send_locked(const std::string& payload, websocketpp::frame::opcode::value opcode) {
        websocketpp::lib::error_code ec;
        client_.send(connection_, payload, opcode, ec);
        if (ec) {
            logging::debug(
                "Deepgram send failed",
                {kv("call_sid", call_sid_),
                 kv("error", ec.message())});
        }
    }

    void on_open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        last_audio_ = std::chrono::steady_clock::now();
        for (const auto& chunk : backlog_) {
            send_locked(chunk, websocketpp::frame::opcode::binary);
        }
        backlog_.clear();
        if (finished_) {
            send_locked(R"({"type":"CloseStream"})", websocketpp::frame::opcode::text);
        }
        schedule_keepalive_locked();
        logging::info(
            "Deepgram stream opened",
            {kv("call_sid", call_sid_)});
    }

    // Audio is suppressed while the agent speaks; Deepgram drops idle sockets.
    void schedule_keepalive_locked() {
        keepalive_timer_ = client_.set_timer(
            static_cast<long>(keepalive_interval_.count()),
            [this](const websocketpp::lib::error_code& ec) {
                if (ec) {
                    return;
                }
                std::lock_guard<std::mutex> lock(mutex_);
                if (!open_ || closed_) {
                    return;
                }
                if (std::chrono::steady_clock::now() - last_audio_ >= keepalive_interval_) {
                    send_locked(R"({"type":"KeepAlive"})", websocketpp::frame::opcode::text);
                }
                schedule_keepalive_locked();
            });
    }

    void on_message(const std::string& payload) {
        try {
            const auto message = nlohmann::json::parse(payload);
            if (message.value("type", "") == "Error" || message.contains("err_code")) {
                logging::warn(
                    "Deepgram reported an error",
                    {kv("call_sid", call_sid_),
                     kv("message", payload.substr(0, 256))});
                return;
            }
            if (auto event = assembler_.handle(message)) {
                events_.push(std::move(*event));
            }
        } catch (const nlohmann::json::exception& ex) {
            logging::debug(
                "Deepgram message ignored",
                {kv("call_sid", call_sid_),
                 kv("error", ex.what())});
        }
    }

    void on_closed(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
            if (keepalive_timer_) {
                keepalive_timer_->cancel();
            }
        }
        if (auto event = assembler_.flush()) {
            events_.push(std::move(*event));
        }
        events_.close();
        logging::info(
            "Deepgram stream closed",
            {kv("call_sid", call_sid_),
             kv("reason", reason)});
    }

    std::string call_sid_;
    std::chrono::milliseconds keepalive_interval_;
    Client client_;
    websocketpp::connection_hdl connection_;
    typename Client::timer_ptr keepalive_timer_;
    std::mutex mutex_;
    bool open_ = false;
    bool finished_ = false;
    bool closed_ = false;
    std::vector<std::string> backlog_;
    std::chrono::steady_clock::time_point last_audio_;
    DeepgramTranscriptAssembler assembler_;
    utils::Channel<TranscriptEvent> events_;
    std::future<void> finished_running_;
    std::thread worker_;
};

}

std::optional<TranscriptEvent> DeepgramTranscriptAssembler::handle(const nlohmann::json& message) {
    const auto type = message.value("type", "");
    if (type == "UtteranceEnd") {
        return flush();
    }
    if (type != "Results") {
        return std::nullopt;
    }

    std::string transcript;
    double confidence = 0.0;
    const auto channel = message.value("channel", nlohmann::json::object());
    const auto alternatives = channel.value("alternatives", nlohmann::json::array());
    if (alternatives.is_array() && !alternatives.empty()) {
        transcript = alternatives[0].value("transcript", "");
        confidence = alternatives[0].value("confidence", 0.0);
    }
    const bool is_final = message.value("is_final", false);
    const bool speech_final = message.value("speech_final", false);

    if (!is_final) {
        if (transcript.empty()) {
            return std::nullopt;
        }
        return TranscriptEvent{append_segment(finals_, transcript), TranscriptKind::Interim,
                               confidence};
    }

    if (!transcript.empty()) {
        finals_ = append_segment(finals_, transcript);
        confidence_ = confidence;
    }
    if (speech_final) {
        return flush();
    }
    if (transcript.empty()) {
        return std::nullopt;
    }
    return TranscriptEvent{finals_, TranscriptKind::Interim, confidence};
}

std::optional<TranscriptEvent> DeepgramTranscriptAssembler::flush() {
    if (finals_.empty()) {
        return std::nullopt;
    }
    TranscriptEvent event{finals_, TranscriptKind::Final, confidence_};
    finals_.clear();
    confidence_ = 0.0;
    return event;
}

DeepgramRecognizer::DeepgramRecognizer(DeepgramSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.api_key.empty()) {
        throw RecognitionFailure("Deepgram API key is not configured");
    }
}

std::string DeepgramRecognizer::build_url(const RecognitionOptions& options) const {
    return settings_.url +
           "?model=" + utils::url_encode(settings_.model) +
           "&language=" + utils::url_encode(options.language) +
           "&encoding=linear16" +
           "&sample_rate=" + std::to_string(options.sample_rate) +
           "&channels=1" +
           "&interim_results=true" +
           "&punctuate=true" +
           "&smart_format=true" +
           "&endpointing=" + std::to_string(settings_.endpointing_ms) +
           "&utterance_end_ms=" + std::to_string(settings_.utterance_end_ms) +
           "&vad_events=true";
}

std::unique_ptr<RecognitionStream> DeepgramRecognizer::start(const RecognitionOptions& options) {
    const auto url = build_url(options);
    logging::debug(
        "Opening Deepgram stream",
        {kv("call_sid", options.call_sid),
         kv("sample_rate", options.sample_rate)});
    if (url.rfind("wss://", 0) == 0) {
        return std::make_unique<DeepgramStream<TlsClient>>(url, settings_.api_key,
                                                           options.call_sid,
                                                           settings_.keepalive_interval);
    }
    return std::make_unique<DeepgramStream<PlainClient>>(url, settings_.api_key,
                                                         options.call_sid,
                                                         settings_.keepalive_interval);
}

}
