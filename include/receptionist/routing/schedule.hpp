#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace receptionist::routing {

struct ScheduleWindow {
    // Three-letter lowercase weekday names; empty means every day.
    std::vector<std::string> days;
    std::string start;
    std::string end;
};

struct BusinessSchedule {
    std::string timezone;
    std::vector<ScheduleWindow> windows;
};

struct ScheduleStatus {
    bool active = true;
    std::string reason = "no_schedule";
    std::optional<std::string> timezone;
};

// Accepts the schedule as a JSON object or a JSON-encoded string. Missing
// timezone or windows yield nullopt ("no schedule").
std::optional<BusinessSchedule> parse_schedule(const nlohmann::json& schedule,
                                               const std::string& fallback_timezone = "");

// Windows whose end is not after their start wrap past midnight. An unknown
// timezone matches no window.
ScheduleStatus evaluate_schedule(const std::optional<BusinessSchedule>& schedule,
                                 std::chrono::system_clock::time_point now);

// Minutes since midnight for "HH:MM"; nullopt when unparseable.
std::optional<int> parse_clock_minutes(const std::string& value);

}
