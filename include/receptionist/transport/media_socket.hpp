#pragma once

#include <string>

namespace receptionist::transport {

// Outbound half of one provider media socket.
class MediaSocket {
public:
    virtual ~MediaSocket() = default;
    // False when the frame could not be written.
    virtual bool send_text(const std::string& payload) = 0;
    virtual void close(const std::string& reason) = 0;
    // Closes with a policy-violation status.
    virtual void reject(const std::string& reason) = 0;
};

// A bound call as seen from the socket.
class MediaCall {
public:
    virtual ~MediaCall() = default;
    virtual void start() = 0;
    virtual void on_media(const std::string& mulaw) = 0;
    virtual void on_mark(const std::string& name) = 0;
    virtual void stop() = 0;
};

}
