#include "receptionist/conversation/turn_heuristics.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <vector>

#include "receptionist/utils/text.hpp"

namespace receptionist::conversation {

const char* const kFallbackUtterance = "Thanks, I have what I need.";
const char* const kSignOff = "Thanks for calling, the team will be in touch soon. Bye for now!";
const char* const kSummaryInstruction =
    "The caller is finished. In one short sentence, confirm back the key details "
    "you captured. Do not ask any further questions.";

namespace {

const std::set<std::string> kConnectives = {
    "and", "or", "but", "so", "because", "to", "for", "with", "at", "in", "on", "of",
    "from", "about", "the", "a", "an", "my", "is", "um", "uh", "like", "then", "if",
    "when",
};

const std::set<std::string> kNumberWords = {
    "zero", "oh", "one", "two", "three", "four", "five", "six", "seven", "eight", "nine",
    "ten", "eleven", "twelve", "thirteen", "fourteen", "fifteen", "sixteen", "seventeen",
    "eighteen", "nineteen", "twenty", "thirty", "forty", "fifty", "sixty", "seventy",
    "eighty", "ninety", "hundred", "thousand", "double", "triple",
};

const std::vector<std::string> kCompletionPhrases = {
    "that's all", "that is all", "that's it", "nothing else", "that's everything",
};

const std::set<std::string> kFarewellWords = {"goodbye", "bye"};

std::string normalize_apostrophes(const std::string& text) {
    static const std::string curly = "\xE2\x80\x99";
    std::string result = text;
    size_t pos = 0;
    while ((pos = result.find(curly, pos)) != std::string::npos) {
        result.replace(pos, curly.size(), "'");
        ++pos;
    }
    return result;
}

bool has_terminal_punctuation(const std::string& trimmed) {
    if (trimmed.empty()) {
        return false;
    }
    const char last = trimmed.back();
    return last == '.' || last == '!' || last == '?';
}

bool is_number_token(const std::string& word) {
    if (kNumberWords.count(word) > 0) {
        return true;
    }
    return !word.empty() && std::isdigit(static_cast<unsigned char>(word.back()));
}

}

bool is_actionable_transcript(const std::string& text, size_t min_chars) {
    const auto trimmed = utils::trim(text);
    return trimmed.size() >= min_chars && utils::contains_alpha(trimmed);
}

bool ends_with_continuation(const std::string& text) {
    const auto trimmed = utils::trim(normalize_apostrophes(text));
    const auto words = utils::split_words(trimmed);
    if (words.empty()) {
        return false;
    }
    if (kConnectives.count(words.back()) > 0) {
        return true;
    }
    const bool terminal = has_terminal_punctuation(trimmed);
    if (!terminal && is_number_token(words.back())) {
        return true;
    }
    return !terminal && words.size() <= 3;
}

bool signals_completion(const std::string& text) {
    const auto words = utils::split_words(normalize_apostrophes(text));
    if (words.empty()) {
        return false;
    }
    std::string joined;
    for (const auto& word : words) {
        if (kFarewellWords.count(word) > 0) {
            return true;
        }
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += word;
    }
    joined = " " + joined + " ";
    return std::any_of(kCompletionPhrases.begin(), kCompletionPhrases.end(),
                       [&joined](const std::string& phrase) {
                           return joined.find(" " + phrase + " ") != std::string::npos;
                       });
}

std::string build_greeting(const std::string& configured,
                           const std::string& business_name,
                           ConversationMode mode) {
    auto base = utils::trim(configured);
    if (base.empty()) {
        const auto name = utils::trim(business_name);
        base = name.empty() ? "Hi, thanks for calling!"
                            : "Hi, thanks for calling " + name + "!";
    }
    if (mode == ConversationMode::Hybrid) {
        return base + " I can take down your details for the team. What do you need a hand with?";
    }
    return base + " What can we help you with?";
}

std::string build_system_prompt(const CallSession& session) {
    std::ostringstream prompt;
    prompt << "You are a friendly, efficient phone receptionist";
    if (!session.business_name.empty()) {
        prompt << " for " << session.business_name;
    }
    prompt << ". Capture the caller's details so the team can follow up.\n\n"
           << "Keep every reply to one or two short sentences and ask one question at a time. "
           << "Do not repeat details the caller already gave. "
           << "When you learn booking details, call extract_booking_details with everything "
           << "captured so far and include a short spoken reply.\n\n"
           << "Capture: caller name, callback number, the service needed, preferred date "
           << "and time, location and urgency.";
    if (!session.questions.empty()) {
        prompt << "\n\nWork these questions into the conversation, one at a time:";
        for (const auto& question : session.questions) {
            prompt << "\n- " << question;
        }
    }
    return prompt.str();
}

std::optional<std::string> next_question(const CallSession& session) {
    for (const auto& question : session.questions) {
        const bool asked = std::any_of(session.turns.begin(), session.turns.end(),
                                       [&question](const ConversationTurn& turn) {
                                           return turn.role == Role::Agent &&
                                                  turn.text == question;
                                       });
        if (!asked) {
            return question;
        }
    }
    return std::nullopt;
}

}
