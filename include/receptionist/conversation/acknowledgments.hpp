#pragma once

#include <cstdint>
#include <deque>
#include <random>
#include <string>
#include <vector>

namespace receptionist::conversation {

const std::vector<std::string>& default_ack_library();

// Trims and drops blank phrases. A library with fewer than min_variety
// phrases is topped up from the default library; an empty one becomes the
// whole default library.
std::vector<std::string> normalize_ack_library(const std::vector<std::string>& library,
                                               size_t min_variety);

class AckRotator {
public:
    AckRotator();
    explicit AckRotator(uint32_t seed);

    // Picks uniformly among phrases not yet in history and records the pick.
    // Once every phrase has been used the history starts over.
    std::string next(const std::vector<std::string>& library, std::deque<std::string>& history);

private:
    std::mt19937 rng_;
};

}
