#include "receptionist/conversation/session.hpp"

#include <algorithm>

#include "receptionist/conversation/acknowledgments.hpp"
#include "receptionist/conversation/turn_heuristics.hpp"
#include "receptionist/utils/text.hpp"

namespace receptionist::conversation {

const char* to_string(Role role) {
    return role == Role::Caller ? "caller" : "agent";
}

const char* to_string(ConversationMode mode) {
    return mode == ConversationMode::Hybrid ? "hybrid" : "intake_only";
}

size_t CallSession::caller_turn_count() const {
    return static_cast<size_t>(std::count_if(turns.begin(), turns.end(),
                                             [](const ConversationTurn& turn) {
                                                 return turn.role == Role::Caller;
                                             }));
}

CallSession make_call_session(const session::SessionParameters& parameters,
                              const std::string& stream_sid,
                              size_t min_ack_variety) {
    CallSession session;
    session.call_sid = parameters.call_sid;
    session.stream_sid = stream_sid;
    session.account_id = parameters.account_id;
    session.from_number = parameters.from_number;
    session.to_number = parameters.to_number;
    session.business_name = parameters.business_name;
    session.mode = parameters.receptionist_mode == "hybrid_choice" ? ConversationMode::Hybrid
                                                                   : ConversationMode::IntakeOnly;
    session.voice.preset = parameters.voice_option.empty() ? "koala_warm"
                                                           : parameters.voice_option;
    session.voice.custom_voice_id = parameters.custom_voice_id;
    for (const auto& question : parameters.questions) {
        if (!utils::trim(question).empty()) {
            session.questions.push_back(utils::trim(question));
        }
    }
    session.greeting = build_greeting(parameters.greeting, session.business_name, session.mode);
    session.system_prompt = build_system_prompt(session);
    session.ack_library = normalize_ack_library(parameters.ack_library, min_ack_variety);
    session.started_at = std::chrono::system_clock::now();
    return session;
}

}
