#pragma once

#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "receptionist/server/inbound_call.hpp"

namespace receptionist::server {

class RestServer {
public:
    RestServer(int port, std::shared_ptr<InboundCallHandler> inbound);

    void start();
    void stop();

private:
    void handle_inbound(const httplib::Request& req, httplib::Response& res);

    int port_;
    std::shared_ptr<InboundCallHandler> inbound_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

// Reads a webhook parameter from the query string or form body.
std::string request_param(const httplib::Request& req,
                          const char* key,
                          const char* alternate = nullptr);

}
