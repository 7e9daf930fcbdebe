#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace receptionist::transport {

struct ConnectedFrame {
    std::string protocol;
};

struct StartFrame {
    std::string stream_sid;
    std::string call_sid;
    std::string account_sid;
    std::map<std::string, std::string> custom_parameters;
    std::string encoding = "audio/x-mulaw";
    int sample_rate = 8000;
    int channels = 1;
};

struct MediaFrame {
    std::string stream_sid;
    std::string track = "inbound";
    uint64_t chunk = 0;
    uint64_t timestamp_ms = 0;
    // Decoded mu-law bytes.
    std::string payload;
};

struct StopFrame {
    std::string stream_sid;
    std::string call_sid;
};

struct MarkFrame {
    std::string stream_sid;
    std::string name;
};

struct UnknownFrame {
    std::string event;
};

struct MalformedFrame {
    std::string error;
};

using InboundFrame = std::variant<ConnectedFrame,
                                  StartFrame,
                                  MediaFrame,
                                  StopFrame,
                                  MarkFrame,
                                  UnknownFrame,
                                  MalformedFrame>;

// Never throws; bad input comes back as MalformedFrame.
InboundFrame parse_frame(const std::string& text);

std::string build_media_frame(const std::string& stream_sid, const std::string& mulaw);
std::string build_mark_frame(const std::string& stream_sid, const std::string& name);
std::string build_clear_frame(const std::string& stream_sid);

}
