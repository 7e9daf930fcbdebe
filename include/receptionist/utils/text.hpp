#pragma once

#include <string>
#include <vector>

namespace receptionist::utils {

// Drops emoji, markdown emphasis marks and malformed UTF-8, collapsing whitespace.
std::string clean_for_speech(const std::string& text);
std::string trim(const std::string& text);
std::string to_lower(std::string text);
std::string xml_escape(const std::string& text);
bool contains_alpha(const std::string& text);

// Lowercased words with surrounding punctuation stripped; apostrophes are kept.
std::vector<std::string> split_words(const std::string& text);

}
