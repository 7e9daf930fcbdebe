#include "receptionist/routing/schedule.hpp"

#include <algorithm>
#include <cstdlib>

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include "receptionist/logging.hpp"
#include "receptionist/utils/text.hpp"

namespace receptionist::routing {

namespace {

std::string day_key(const std::string& day) {
    return utils::to_lower(utils::trim(day)).substr(0, 3);
}

std::string weekday_key(absl::Weekday weekday) {
    switch (weekday) {
        case absl::Weekday::monday:
            return "mon";
        case absl::Weekday::tuesday:
            return "tue";
        case absl::Weekday::wednesday:
            return "wed";
        case absl::Weekday::thursday:
            return "thu";
        case absl::Weekday::friday:
            return "fri";
        case absl::Weekday::saturday:
            return "sat";
        case absl::Weekday::sunday:
            return "sun";
    }
    return "";
}

std::string string_value(const nlohmann::json& object, const char* key, const char* alternate) {
    for (const char* name : {key, alternate}) {
        const auto it = object.find(name);
        if (it != object.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return "";
}

ScheduleWindow parse_window(const nlohmann::json& value) {
    ScheduleWindow window;
    const auto days = value.find("days");
    if (days != value.end() && days->is_array()) {
        for (const auto& day : *days) {
            if (day.is_string()) {
                window.days.push_back(day_key(day.get<std::string>()));
            }
        }
    } else {
        const auto day = value.find("day");
        if (day != value.end() && day->is_string() && !day->get<std::string>().empty()) {
            window.days.push_back(day_key(day->get<std::string>()));
        }
    }
    window.start = string_value(value, "start", "startTime");
    window.end = string_value(value, "end", "endTime");
    return window;
}

bool within_window(const ScheduleWindow& window, const std::string& weekday, int minutes) {
    if (!window.days.empty() &&
        std::find(window.days.begin(), window.days.end(), weekday) == window.days.end()) {
        return false;
    }
    const auto start = parse_clock_minutes(window.start);
    const auto end = parse_clock_minutes(window.end);
    if (!start || !end) {
        return false;
    }
    if (*end <= *start) {
        return minutes >= *start || minutes < *end;
    }
    return minutes >= *start && minutes < *end;
}

}

std::optional<int> parse_clock_minutes(const std::string& value) {
    const auto trimmed = utils::trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    const auto colon = trimmed.find(':');
    const auto hour_text = trimmed.substr(0, colon);
    const auto minute_text = colon == std::string::npos ? "0" : trimmed.substr(colon + 1, 2);
    char* end = nullptr;
    const long hours = std::strtol(hour_text.c_str(), &end, 10);
    if (hour_text.empty() || *end != '\0' || hours < 0 || hours > 24) {
        return std::nullopt;
    }
    const long minutes = std::strtol(minute_text.c_str(), &end, 10);
    if (minute_text.empty() || *end != '\0' || minutes < 0 || minutes > 59) {
        return std::nullopt;
    }
    return static_cast<int>(hours * 60 + minutes);
}

std::optional<BusinessSchedule> parse_schedule(const nlohmann::json& schedule,
                                               const std::string& fallback_timezone) {
    nlohmann::json parsed = schedule;
    if (schedule.is_string()) {
        try {
            parsed = nlohmann::json::parse(schedule.get<std::string>());
        } catch (const nlohmann::json::parse_error& ex) {
            logging::warn(
                "Failed to parse schedule JSON",
                {kv("error", ex.what())});
            return std::nullopt;
        }
    }
    if (!parsed.is_object()) {
        return std::nullopt;
    }

    BusinessSchedule result;
    result.timezone = string_value(parsed, "timezone", "timeZone");
    if (result.timezone.empty()) {
        result.timezone = fallback_timezone;
    }
    const auto windows = parsed.find("windows");
    if (windows != parsed.end() && windows->is_array()) {
        for (const auto& window : *windows) {
            if (window.is_object()) {
                result.windows.push_back(parse_window(window));
            }
        }
    }
    if (result.timezone.empty() || result.windows.empty()) {
        return std::nullopt;
    }
    return result;
}

ScheduleStatus evaluate_schedule(const std::optional<BusinessSchedule>& schedule,
                                 std::chrono::system_clock::time_point now) {
    ScheduleStatus status;
    if (!schedule) {
        return status;
    }
    status.timezone = schedule->timezone;

    absl::TimeZone zone;
    if (!absl::LoadTimeZone(schedule->timezone, &zone)) {
        logging::warn(
            "Unknown schedule timezone; treating as after hours",
            {kv("timezone", schedule->timezone)});
        status.active = false;
        status.reason = "after_hours";
        return status;
    }

    const auto local = absl::ToCivilMinute(absl::FromChrono(now), zone);
    const auto weekday = weekday_key(absl::GetWeekday(absl::CivilDay(local)));
    const int minutes = local.hour() * 60 + local.minute();

    status.active = std::any_of(schedule->windows.begin(), schedule->windows.end(),
                                [&](const ScheduleWindow& window) {
                                    return within_window(window, weekday, minutes);
                                });
    status.reason = status.active ? "within_business_hours" : "after_hours";
    return status;
}

}
