#include "receptionist/server/rest_server.hpp"

#include <nlohmann/json.hpp>

#include "receptionist/logging.hpp"
#include "receptionist/metrics.hpp"

namespace receptionist::server {

namespace {

const char* const kXmlContentType = "text/xml";

}

std::string request_param(const httplib::Request& req, const char* key, const char* alternate) {
    if (req.has_param(key) && !req.get_param_value(key).empty()) {
        return req.get_param_value(key);
    }
    if (alternate && req.has_param(alternate)) {
        return req.get_param_value(alternate);
    }
    return "";
}

RestServer::RestServer(int port, std::shared_ptr<InboundCallHandler> inbound)
    : port_(port), inbound_(std::move(inbound)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    auto inbound = [this](const httplib::Request& req, httplib::Response& res) {
        handle_inbound(req, res);
    };
    server_->Get("/telephony/inbound-voice", inbound);
    server_->Post("/telephony/inbound-voice", inbound);

    server_->Post("/telephony/stream-status", [](const httplib::Request& req,
                                                  httplib::Response& res) {
        logging::info(
            "Media stream status",
            {kv("call_sid", request_param(req, "CallSid")),
             kv("stream_sid", request_param(req, "StreamSid")),
             kv("event", request_param(req, "StreamEvent")),
             kv("error", request_param(req, "StreamError"))});
        res.status = 200;
    });

    server_->Post("/telephony/recording-complete", [](const httplib::Request& req,
                                                       httplib::Response& res) {
        logging::info(
            "Voicemail recorded",
            {kv("call_sid", request_param(req, "CallSid")),
             kv("recording_url", request_param(req, "RecordingUrl")),
             kv("duration", request_param(req, "RecordingDuration"))});
        res.set_content(recording_complete_twiml(), kXmlContentType);
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", port_)});
        if (!server_->listen("0.0.0.0", port_)) {
            logging::error(
                "REST server failed to listen",
                {kv("port", port_)});
        }
    });
}

void RestServer::handle_inbound(const httplib::Request& req, httplib::Response& res) {
    InboundCall call;
    call.call_sid = request_param(req, "CallSid");
    call.to_number = request_param(req, "To", "Called");
    call.from_number = request_param(req, "From", "Caller");
    call.digits = request_param(req, "Digits");
    call.speech_result = request_param(req, "SpeechResult", "UnstableSpeechResult");
    call.decision = request_param(req, "decision");
    const auto stage = request_param(req, "stage");
    if (!stage.empty()) {
        call.stage = stage;
    }

    logging::info(
        "Inbound voice webhook",
        {kv("call_sid", call.call_sid),
         kv("to", call.to_number),
         kv("from", call.from_number),
         kv("stage", call.stage)});
    res.set_content(inbound_->handle(call), kXmlContentType);
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

}
