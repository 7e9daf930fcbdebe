#include "receptionist/utils/text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>

namespace receptionist::utils {

namespace {

struct CodepointRange {
    uint32_t first;
    uint32_t last;
};

// Pictographs, dingbats, flags and their joiners; synthesizers read these out by name.
const CodepointRange kEmojiRanges[] = {
    {0x1F300, 0x1FAFF},
    {0x1F1E6, 0x1F1FF},
    {0x2600, 0x27BF},
    {0x200D, 0x200D},
    {0xFE0F, 0xFE0F},
};

bool is_emoji(uint32_t codepoint) {
    return std::any_of(std::begin(kEmojiRanges), std::end(kEmojiRanges),
                       [codepoint](const CodepointRange& range) {
                           return codepoint >= range.first && codepoint <= range.last;
                       });
}

// Length of the UTF-8 sequence at index, or 0 when it is malformed.
size_t read_codepoint(const std::string& text, size_t index, uint32_t& codepoint) {
    const auto lead = static_cast<unsigned char>(text[index]);
    size_t length = 0;
    if (lead < 0x80) {
        codepoint = lead;
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        codepoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        codepoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        codepoint = lead & 0x07;
    } else {
        return 0;
    }
    if (index + length > text.size()) {
        return 0;
    }
    for (size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[index + i]);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        codepoint = (codepoint << 6) | (next & 0x3F);
    }
    return length;
}

bool is_markdown_mark(char ch) {
    return ch == '*' || ch == '_' || ch == '#' || ch == '`' || ch == '~';
}

}

std::string clean_for_speech(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    bool pending_space = false;
    for (size_t i = 0; i < text.size();) {
        uint32_t codepoint = 0;
        const auto length = read_codepoint(text, i, codepoint);
        if (length == 0) {
            ++i;
            continue;
        }
        const auto ch = text[i];
        if (length == 1 && std::isspace(static_cast<unsigned char>(ch))) {
            pending_space = !cleaned.empty();
        } else if (!(length == 1 && is_markdown_mark(ch)) && !is_emoji(codepoint)) {
            if (pending_space) {
                cleaned.push_back(' ');
                pending_space = false;
            }
            cleaned.append(text, i, length);
        }
        i += length;
    }
    return cleaned;
}

std::string trim(const std::string& text) {
    const auto first = std::find_if(text.begin(), text.end(),
                                     [](unsigned char ch) { return !std::isspace(ch); });
    const auto last = std::find_if(text.rbegin(), text.rend(),
                                   [](unsigned char ch) { return !std::isspace(ch); }).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::string xml_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&apos;";
                break;
            default:
                escaped.push_back(ch);
        }
    }
    return escaped;
}

bool contains_alpha(const std::string& text) {
    return std::any_of(text.begin(), text.end(),
                       [](unsigned char ch) { return std::isalpha(ch) != 0; });
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char ch : text) {
        if (std::isalnum(ch) || ch == '\'' || ch >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(ch)));
            continue;
        }
        if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    for (auto& word : words) {
        while (!word.empty() && word.front() == '\'') {
            word.erase(word.begin());
        }
        while (!word.empty() && word.back() == '\'') {
            word.pop_back();
        }
    }
    words.erase(std::remove_if(words.begin(), words.end(),
                               [](const std::string& word) { return word.empty(); }),
                words.end());
    return words;
}

}
