#pragma once

#include <string>

namespace receptionist::server {

enum class HybridChoice {
    Voicemail,
    Receptionist,
};

std::string voicemail_twiml(const std::string& greeting, const std::string& recording_action_url);

// Offers 1 / "leave a message" for voicemail and 2 / "talk to the
// receptionist"; no input falls through to voicemail via fallback_url.
std::string hybrid_choice_twiml(const std::string& greeting,
                                const std::string& action_url,
                                const std::string& fallback_url);

std::string connect_stream_twiml(const std::string& stream_url,
                                 const std::string& call_sid,
                                 const std::string& account_id);

std::string recording_complete_twiml();

// Digits win over speech; unrecognized input goes to the receptionist.
HybridChoice interpret_hybrid_choice(const std::string& digits, const std::string& speech);

}
