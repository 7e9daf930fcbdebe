#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "receptionist/conversation/session.hpp"

namespace receptionist {
class HttpClient;
}

namespace receptionist::conversation {

struct CompletionEvent {
    std::string call_sid;
    std::string account_id;
    std::string from_number;
    std::string to_number;
    std::vector<ConversationTurn> turns;
    nlohmann::json entities = nlohmann::json::object();
    std::string termination_reason;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point completed_at;

    static CompletionEvent from_session(const CallSession& session);
    nlohmann::json to_json() const;
};

class CompletionSink {
public:
    virtual ~CompletionSink() = default;
    virtual void publish(const CompletionEvent& event) = 0;
};

// Hands the event to the job-creation backend on a background thread.
// Delivery failures are logged and dropped.
class BackendCompletionSink : public CompletionSink {
public:
    explicit BackendCompletionSink(std::shared_ptr<HttpClient> client);

    void publish(const CompletionEvent& event) override;

private:
    std::shared_ptr<HttpClient> client_;
};

}
