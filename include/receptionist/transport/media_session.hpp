#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "receptionist/session/parameter_cache.hpp"
#include "receptionist/transport/media_frames.hpp"
#include "receptionist/transport/media_socket.hpp"

namespace receptionist::transport {

// Frame handling for one media socket: binds the stream to its cached session
// parameters on `start` and forwards audio to the call.
class MediaSession {
public:
    using CallFactory = std::function<std::shared_ptr<MediaCall>(
        const session::SessionParameters& parameters,
        const StartFrame& start,
        std::shared_ptr<MediaSocket> socket)>;

    MediaSession(std::shared_ptr<MediaSocket> socket,
                 std::shared_ptr<session::SessionParameterCache> sessions,
                 CallFactory factory,
                 std::string query_call_sid = "");
    ~MediaSession();

    void handle_text(const std::string& text);
    // Socket went away; tears the call down synchronously.
    void close();

    bool is_bound() const;
    std::optional<std::string> call_sid() const;

private:
    void on_start(const StartFrame& frame);
    void teardown(const char* reason);

    std::shared_ptr<MediaSocket> socket_;
    std::shared_ptr<session::SessionParameterCache> sessions_;
    CallFactory factory_;
    std::string query_call_sid_;

    mutable std::mutex mutex_;
    std::shared_ptr<MediaCall> call_;
    std::optional<std::string> call_sid_;
    bool rejected_ = false;
};

}
