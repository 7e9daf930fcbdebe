#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "receptionist/session/parameter_cache.hpp"
#include "receptionist/transport/media_session.hpp"

namespace receptionist::transport {

// WebSocket endpoint for the provider's bidirectional media streams.
class MediaServer {
public:
    MediaServer(int port,
                int threads,
                std::string path,
                std::shared_ptr<session::SessionParameterCache> sessions,
                MediaSession::CallFactory factory);
    ~MediaServer();

    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;

    void start();
    void stop();
    size_t active_sessions() const;

private:
    struct Impl;

    int port_;
    int threads_;
    std::string path_;
    std::shared_ptr<session::SessionParameterCache> sessions_;
    MediaSession::CallFactory factory_;
    std::unique_ptr<Impl> impl_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
};

}
