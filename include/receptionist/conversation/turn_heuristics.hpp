#pragma once

#include <optional>
#include <string>

#include "receptionist/conversation/session.hpp"

namespace receptionist::conversation {

extern const char* const kFallbackUtterance;
extern const char* const kSignOff;
extern const char* const kSummaryInstruction;

// At least min_chars after trimming and at least one letter.
bool is_actionable_transcript(const std::string& text, size_t min_chars);

// The caller is probably mid-sentence: trailing connective word, digits or
// number words still being read out, or a short fragment with no terminal
// punctuation.
bool ends_with_continuation(const std::string& text);

bool signals_completion(const std::string& text);

std::string build_greeting(const std::string& configured,
                           const std::string& business_name,
                           ConversationMode mode);

std::string build_system_prompt(const CallSession& session);

// First intake question the agent has not spoken yet.
std::optional<std::string> next_question(const CallSession& session);

}
