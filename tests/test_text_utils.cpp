#include <catch2/catch_test_macros.hpp>

#include "receptionist/utils/text.hpp"

#include <string>
#include <vector>

TEST_CASE("clean_for_speech strips emoji and collapses the gap") {
    const std::string emoji = "\xF0\x9F\x98\x80";
    REQUIRE(receptionist::utils::clean_for_speech("Hello " + emoji + " world") == "Hello world");
}

TEST_CASE("clean_for_speech removes markdown emphasis") {
    REQUIRE(receptionist::utils::clean_for_speech("**Great!** Which _suburb_ are you in?") ==
            "Great! Which suburb are you in?");
}

TEST_CASE("clean_for_speech joins lines and keeps accented text") {
    REQUIRE(receptionist::utils::clean_for_speech("  Line one.\n\nLine two. ") ==
            "Line one. Line two.");
    const std::string cafe = "Caf\xC3\xA9 on Smith St.";
    REQUIRE(receptionist::utils::clean_for_speech(cafe) == cafe);
}

TEST_CASE("clean_for_speech drops truncated UTF-8 sequences") {
    REQUIRE(receptionist::utils::clean_for_speech("ok \xF0\x9F") == "ok");
}

TEST_CASE("trim handles blank and surrounded input") {
    REQUIRE(receptionist::utils::trim("   ").empty());
    REQUIRE(receptionist::utils::trim("\n hi there \t") == "hi there");
}

TEST_CASE("xml_escape escapes markup characters") {
    REQUIRE(receptionist::utils::xml_escape("Tom & Jerry's <shop> \"open\"") ==
            "Tom &amp; Jerry&apos;s &lt;shop&gt; &quot;open&quot;");
}

TEST_CASE("contains_alpha needs at least one letter") {
    REQUIRE_FALSE(receptionist::utils::contains_alpha("123 ... !"));
    REQUIRE(receptionist::utils::contains_alpha("42b"));
}

TEST_CASE("split_words lowercases and strips punctuation but keeps contractions") {
    const std::vector<std::string> expected = {"that's", "all", "thanks"};
    REQUIRE(receptionist::utils::split_words("That's ALL, 'thanks'!") == expected);
}
