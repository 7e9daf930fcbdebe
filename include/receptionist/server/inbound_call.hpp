#pragma once

#include <memory>
#include <string>

#include "receptionist/routing/directory.hpp"
#include "receptionist/routing/engine.hpp"
#include "receptionist/session/parameter_cache.hpp"

namespace receptionist::server {

struct InboundCall {
    std::string call_sid;
    std::string to_number;
    std::string from_number;
    // initial | choice
    std::string stage = "initial";
    // Set by the hybrid fallback redirect to force voicemail.
    std::string decision;
    std::string digits;
    std::string speech_result;
};

struct InboundSettings {
    std::string public_url;
    std::string media_stream_url;
    bool conversation_enabled = true;
};

// Answers the provider's voice webhook with call-control markup. Never throws;
// any failure answers with voicemail.
class InboundCallHandler {
public:
    InboundCallHandler(std::shared_ptr<routing::RoutingEngine> routing,
                       std::shared_ptr<routing::AccountDirectory> directory,
                       std::shared_ptr<session::SessionParameterCache> sessions,
                       InboundSettings settings);

    std::string handle(const InboundCall& call);

private:
    std::string route(const InboundCall& call);
    std::string handle_choice(const InboundCall& call);
    std::string answer_with_receptionist(const InboundCall& call,
                                         const routing::Account& account,
                                         const std::string& reason);
    std::string voicemail(const std::string& greeting = "") const;
    std::string url(const std::string& path) const;

    std::shared_ptr<routing::RoutingEngine> routing_;
    std::shared_ptr<routing::AccountDirectory> directory_;
    std::shared_ptr<session::SessionParameterCache> sessions_;
    InboundSettings settings_;
};

}
