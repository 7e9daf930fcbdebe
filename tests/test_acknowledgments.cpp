#include <catch2/catch_test_macros.hpp>

#include "receptionist/conversation/acknowledgments.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <string>
#include <vector>

using receptionist::conversation::AckRotator;
using receptionist::conversation::default_ack_library;
using receptionist::conversation::normalize_ack_library;

TEST_CASE("an empty ack library becomes the default library") {
    REQUIRE(normalize_ack_library({}, 5) == default_ack_library());
    REQUIRE(normalize_ack_library({"  ", ""}, 5) == default_ack_library());
    REQUIRE(default_ack_library().size() == 10);
}

TEST_CASE("a short ack library is topped up to the minimum variety") {
    const auto library = normalize_ack_library({" Cheers! ", "Cheers!", "Nice one."}, 5);
    REQUIRE(library.size() == 5);
    REQUIRE(library[0] == "Cheers!");
    REQUIRE(library[1] == "Nice one.");
    REQUIRE(library[2] == default_ack_library()[0]);
}

TEST_CASE("a large ack library is kept as configured") {
    const std::vector<std::string> configured = {"a", "b", "c", "d", "e", "f"};
    REQUIRE(normalize_ack_library(configured, 5) == configured);
}

TEST_CASE("acks do not repeat until the whole library has been used") {
    AckRotator rotator(1234);
    const std::vector<std::string> library = {"One.", "Two.", "Three.", "Four."};
    std::deque<std::string> history;

    std::set<std::string> first_round;
    for (size_t i = 0; i < library.size(); ++i) {
        first_round.insert(rotator.next(library, history));
    }
    REQUIRE(first_round.size() == library.size());

    const auto fifth = rotator.next(library, history);
    REQUIRE(std::find(library.begin(), library.end(), fifth) != library.end());
    REQUIRE(history.size() == 1);
}

TEST_CASE("consecutive acks differ over many draws") {
    AckRotator rotator(99);
    const auto& library = default_ack_library();
    std::deque<std::string> history;
    std::string previous;
    for (int i = 0; i < 100; ++i) {
        const auto ack = rotator.next(library, history);
        REQUIRE(history.size() <= library.size());
        if (i % static_cast<int>(library.size()) != 0) {
            REQUIRE(ack != previous);
        }
        previous = ack;
    }
}
