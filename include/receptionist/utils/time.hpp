#pragma once

#include <chrono>
#include <string>

namespace receptionist::utils {

// UTC, millisecond precision: 2024-05-01T09:30:00.000Z
std::string format_timestamp(std::chrono::system_clock::time_point at);

}
