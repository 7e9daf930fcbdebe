#include "receptionist/conversation/completion.hpp"

#include "receptionist/http/client.hpp"
#include "receptionist/logging.hpp"
#include "receptionist/utils/async.hpp"
#include "receptionist/utils/http.hpp"
#include "receptionist/utils/time.hpp"

namespace receptionist::conversation {

CompletionEvent CompletionEvent::from_session(const CallSession& session) {
    CompletionEvent event;
    event.call_sid = session.call_sid;
    event.account_id = session.account_id;
    event.from_number = session.from_number;
    event.to_number = session.to_number;
    event.turns = session.turns;
    event.entities = session.entities;
    event.termination_reason = session.termination_reason;
    event.started_at = session.started_at;
    event.completed_at = session.completed_at.value_or(std::chrono::system_clock::now());
    return event;
}

nlohmann::json CompletionEvent::to_json() const {
    nlohmann::json turns_json = nlohmann::json::array();
    for (const auto& turn : turns) {
        nlohmann::json item = {
            {"role", to_string(turn.role)},
            {"text", turn.text},
            {"at", utils::format_timestamp(turn.at)},
        };
        if (turn.entities) {
            item["entities"] = *turn.entities;
        }
        turns_json.push_back(std::move(item));
    }
    return {
        {"call_sid", call_sid},
        {"account_id", account_id},
        {"from", from_number},
        {"to", to_number},
        {"turns", std::move(turns_json)},
        {"entities", entities},
        {"termination_reason", termination_reason},
        {"started_at", utils::format_timestamp(started_at)},
        {"completed_at", utils::format_timestamp(completed_at)},
    };
}

BackendCompletionSink::BackendCompletionSink(std::shared_ptr<HttpClient> client)
    : client_(std::move(client)) {}

void BackendCompletionSink::publish(const CompletionEvent& event) {
    if (!client_) {
        logging::warn(
            "No completion backend configured; dropping event",
            {kv("call_sid", event.call_sid)});
        return;
    }
    auto client = client_;
    auto path = "/calls/" + utils::url_encode(event.call_sid) + "/conversation";
    auto body = event.to_json();
    auto call_sid = event.call_sid;
    utils::run_async(
        [client, path, body, call_sid]() {
            try {
                client->post_json(path, body);
                logging::info(
                    "Completion event delivered",
                    {kv("call_sid", call_sid)});
            } catch (const HttpError& ex) {
                logging::error(
                    "Completion event delivery failed",
                    {kv("call_sid", call_sid),
                     kv("status", ex.status()),
                     kv("error", ex.what())});
            }
        },
        "completion-publish");
}

}
