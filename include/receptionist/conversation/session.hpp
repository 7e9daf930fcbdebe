#pragma once

#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "receptionist/providers/speech.hpp"
#include "receptionist/session/parameter_cache.hpp"

namespace receptionist::conversation {

enum class Role {
    Caller,
    Agent,
};

enum class ConversationMode {
    IntakeOnly,
    Hybrid,
};

const char* to_string(Role role);
const char* to_string(ConversationMode mode);

struct ConversationTurn {
    Role role = Role::Caller;
    std::string text;
    std::optional<nlohmann::json> entities;
    std::chrono::system_clock::time_point at = std::chrono::system_clock::now();
};

struct CallSession {
    std::string call_sid;
    std::string stream_sid;
    std::string account_id;
    std::string from_number;
    std::string to_number;
    std::string business_name;
    ConversationMode mode = ConversationMode::IntakeOnly;
    providers::VoiceSelection voice;
    std::string greeting;
    std::vector<std::string> questions;
    std::string system_prompt;
    std::vector<std::string> ack_library;
    std::vector<ConversationTurn> turns;
    std::deque<std::string> ack_history;
    nlohmann::json entities = nlohmann::json::object();
    std::chrono::system_clock::time_point started_at = std::chrono::system_clock::now();
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::string termination_reason;

    size_t caller_turn_count() const;
};

// Builds the per-call session from the webhook handoff. The greeting, system
// prompt and acknowledgment library are resolved here once.
CallSession make_call_session(const session::SessionParameters& parameters,
                              const std::string& stream_sid,
                              size_t min_ack_variety);

}
