#include "receptionist/conversation/acknowledgments.hpp"

#include <algorithm>

#include "receptionist/utils/text.hpp"

namespace receptionist::conversation {

const std::vector<std::string>& default_ack_library() {
    static const std::vector<std::string> library = {
        "Got it!",
        "Perfect, thanks!",
        "Understood.",
        "That helps, thank you.",
        "Great, keep going.",
        "Heard you loud and clear.",
        "Awesome, let me note that.",
        "Thanks, just a sec.",
        "Okay, appreciate the detail.",
        "Brilliant, one moment.",
    };
    return library;
}

std::vector<std::string> normalize_ack_library(const std::vector<std::string>& library,
                                               size_t min_variety) {
    std::vector<std::string> cleaned;
    for (const auto& entry : library) {
        auto phrase = utils::trim(entry);
        if (phrase.empty() ||
            std::find(cleaned.begin(), cleaned.end(), phrase) != cleaned.end()) {
            continue;
        }
        cleaned.push_back(std::move(phrase));
    }
    if (cleaned.empty()) {
        return default_ack_library();
    }
    for (const auto& fallback : default_ack_library()) {
        if (cleaned.size() >= min_variety) {
            break;
        }
        if (std::find(cleaned.begin(), cleaned.end(), fallback) == cleaned.end()) {
            cleaned.push_back(fallback);
        }
    }
    return cleaned;
}

AckRotator::AckRotator() : rng_(std::random_device{}()) {}

AckRotator::AckRotator(uint32_t seed) : rng_(seed) {}

std::string AckRotator::next(const std::vector<std::string>& library,
                             std::deque<std::string>& history) {
    const auto& phrases = library.empty() ? default_ack_library() : library;

    std::vector<const std::string*> available;
    for (const auto& phrase : phrases) {
        if (std::find(history.begin(), history.end(), phrase) == history.end()) {
            available.push_back(&phrase);
        }
    }
    if (available.empty()) {
        history.clear();
        for (const auto& phrase : phrases) {
            available.push_back(&phrase);
        }
    }

    std::uniform_int_distribution<size_t> pick(0, available.size() - 1);
    const auto& choice = *available[pick(rng_)];
    history.push_back(choice);
    while (history.size() > phrases.size()) {
        history.pop_front();
    }
    return choice;
}

}
