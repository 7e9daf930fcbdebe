#include "receptionist/transport/media_session.hpp"

#include "receptionist/logging.hpp"

namespace receptionist::transport {

MediaSession::MediaSession(std::shared_ptr<MediaSocket> socket,
                           std::shared_ptr<session::SessionParameterCache> sessions,
                           CallFactory factory,
                           std::string query_call_sid)
    : socket_(std::move(socket)),
      sessions_(std::move(sessions)),
      factory_(std::move(factory)),
      query_call_sid_(std::move(query_call_sid)) {}

MediaSession::~MediaSession() {
    close();
}

void MediaSession::handle_text(const std::string& text) {
    const auto frame = parse_frame(text);

    if (const auto* media = std::get_if<MediaFrame>(&frame)) {
        std::shared_ptr<MediaCall> call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            call = call_;
        }
        if (call && media->track != "outbound") {
            call->on_media(media->payload);
        }
        return;
    }
    if (const auto* start = std::get_if<StartFrame>(&frame)) {
        on_start(*start);
        return;
    }
    if (const auto* mark = std::get_if<MarkFrame>(&frame)) {
        std::shared_ptr<MediaCall> call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            call = call_;
        }
        if (call) {
            call->on_mark(mark->name);
        }
        return;
    }
    if (std::holds_alternative<StopFrame>(frame)) {
        teardown("stop");
        return;
    }
    if (const auto* connected = std::get_if<ConnectedFrame>(&frame)) {
        logging::debug(
            "Media stream connected",
            {kv("protocol", connected->protocol)});
        return;
    }
    if (const auto* unknown = std::get_if<UnknownFrame>(&frame)) {
        logging::debug(
            "Ignoring unknown media event",
            {kv("event", unknown->event)});
        return;
    }
    if (const auto* malformed = std::get_if<MalformedFrame>(&frame)) {
        logging::debug(
            "Dropping malformed media frame",
            {kv("call_sid", call_sid()),
             kv("error", malformed->error)});
    }
}

void MediaSession::on_start(const StartFrame& frame) {
    std::string call_sid = frame.call_sid;
    if (call_sid.empty()) {
        const auto it = frame.custom_parameters.find("callSid");
        if (it != frame.custom_parameters.end()) {
            call_sid = it->second;
        }
    }
    if (call_sid.empty()) {
        call_sid = query_call_sid_;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (call_ || rejected_) {
            logging::warn(
                "Duplicate start frame ignored",
                {kv("call_sid", call_sid)});
            return;
        }
    }

    std::optional<session::SessionParameters> parameters;
    if (!call_sid.empty()) {
        parameters = sessions_->claim(call_sid);
    }
    if (!parameters) {
        const bool bound_elsewhere = !call_sid.empty() && sessions_->is_claimed(call_sid);
        logging::warn(
            bound_elsewhere ? "Call already has a media stream; rejecting"
                            : "Media stream has no session parameters; rejecting",
            {kv("call_sid", call_sid),
             kv("stream_sid", frame.stream_sid)});
        {
            std::lock_guard<std::mutex> lock(mutex_);
            rejected_ = true;
        }
        socket_->reject(bound_elsewhere ? "call already bound" : "unknown call");
        return;
    }

    auto call = factory_(*parameters, frame, socket_);
    if (!call) {
        logging::error(
            "Failed to create call for media stream",
            {kv("call_sid", call_sid)});
        sessions_->release(call_sid);
        socket_->close("call unavailable");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        call_ = call;
        call_sid_ = call_sid;
    }
    logging::info(
        "Media stream bound",
        {kv("call_sid", call_sid),
         kv("stream_sid", frame.stream_sid),
         kv("encoding", frame.encoding),
         kv("sample_rate", frame.sample_rate)});
    call->start();
}

void MediaSession::close() {
    teardown("socket_closed");
}

void MediaSession::teardown(const char* reason) {
    std::shared_ptr<MediaCall> call;
    std::optional<std::string> call_sid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        call = std::move(call_);
        call_.reset();
        call_sid = call_sid_;
    }
    if (!call) {
        return;
    }
    logging::info(
        "Media stream ended",
        {kv("call_sid", call_sid),
         kv("reason", reason)});
    call->stop();
    if (call_sid) {
        sessions_->erase(*call_sid);
    }
}

bool MediaSession::is_bound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(call_);
}

std::optional<std::string> MediaSession::call_sid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return call_sid_;
}

}
