#include "receptionist/transport/media_frames.hpp"

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

namespace receptionist::transport {

namespace {

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// The provider sends counters as decimal strings; accept numbers as well.
uint64_t counter_field(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return 0;
    }
    if (it->is_number_unsigned() || it->is_number_integer()) {
        return it->get<uint64_t>();
    }
    if (it->is_string()) {
        try {
            return std::stoull(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

StartFrame parse_start(const nlohmann::json& message) {
    StartFrame frame;
    const auto start = message.value("start", nlohmann::json::object());
    frame.stream_sid = string_field(start, "streamSid");
    if (frame.stream_sid.empty()) {
        frame.stream_sid = string_field(message, "streamSid");
    }
    frame.call_sid = string_field(start, "callSid");
    frame.account_sid = string_field(start, "accountSid");

    const auto custom = start.find("customParameters");
    if (custom != start.end() && custom->is_object()) {
        for (const auto& item : custom->items()) {
            if (item.value().is_string()) {
                frame.custom_parameters[item.key()] = item.value().get<std::string>();
            } else {
                frame.custom_parameters[item.key()] = item.value().dump();
            }
        }
    }

    const auto format = start.find("mediaFormat");
    if (format != start.end() && format->is_object()) {
        frame.encoding = format->value("encoding", frame.encoding);
        frame.sample_rate = format->value("sampleRate", frame.sample_rate);
        frame.channels = format->value("channels", frame.channels);
    }
    return frame;
}

}

InboundFrame parse_frame(const std::string& text) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return MalformedFrame{ex.what()};
    }
    if (!message.is_object()) {
        return MalformedFrame{"frame is not a JSON object"};
    }
    const auto event = string_field(message, "event");
    if (event.empty()) {
        return MalformedFrame{"frame has no event"};
    }

    try {
        if (event == "connected") {
            return ConnectedFrame{string_field(message, "protocol")};
        }
        if (event == "start") {
            return parse_start(message);
        }
        if (event == "media") {
            const auto media = message.find("media");
            if (media == message.end() || !media->is_object()) {
                return MalformedFrame{"media frame without media object"};
            }
            const auto payload = media->find("payload");
            if (payload == media->end() || !payload->is_string()) {
                return MalformedFrame{"media frame without payload"};
            }
            MediaFrame frame;
            frame.stream_sid = string_field(message, "streamSid");
            const auto track = string_field(*media, "track");
            if (!track.empty()) {
                frame.track = track;
            }
            frame.chunk = counter_field(*media, "chunk");
            frame.timestamp_ms = counter_field(*media, "timestamp");
            frame.payload = websocketpp::base64_decode(payload->get<std::string>());
            return frame;
        }
        if (event == "stop") {
            StopFrame frame;
            frame.stream_sid = string_field(message, "streamSid");
            frame.call_sid = string_field(message.value("stop", nlohmann::json::object()),
                                          "callSid");
            return frame;
        }
        if (event == "mark") {
            MarkFrame frame;
            frame.stream_sid = string_field(message, "streamSid");
            frame.name = string_field(message.value("mark", nlohmann::json::object()), "name");
            return frame;
        }
    } catch (const nlohmann::json::exception& ex) {
        return MalformedFrame{ex.what()};
    }
    return UnknownFrame{event};
}

std::string build_media_frame(const std::string& stream_sid, const std::string& mulaw) {
    const nlohmann::json frame = {
        {"event", "media"},
        {"streamSid", stream_sid},
        {"media", {{"payload", websocketpp::base64_encode(mulaw)}}},
    };
    return frame.dump();
}

std::string build_mark_frame(const std::string& stream_sid, const std::string& name) {
    const nlohmann::json frame = {
        {"event", "mark"},
        {"streamSid", stream_sid},
        {"mark", {{"name", name}}},
    };
    return frame.dump();
}

std::string build_clear_frame(const std::string& stream_sid) {
    const nlohmann::json frame = {
        {"event", "clear"},
        {"streamSid", stream_sid},
    };
    return frame.dump();
}

}
