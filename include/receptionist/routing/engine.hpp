#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "receptionist/routing/directory.hpp"
#include "receptionist/routing/schedule.hpp"

namespace receptionist::routing {

enum class Route {
    Intake,
    Voicemail,
};

const char* to_string(Route route);

struct RouteChoice {
    Route route = Route::Voicemail;
    std::string reason;
};

struct RoutingDecision {
    Route route = Route::Voicemail;
    std::string reason = "fallback_default";
    std::string mode = "voicemail";
    bool fallback = false;
    bool feature_enabled = true;
    std::optional<Account> account;
    std::optional<CallerRecord> caller;
    ScheduleStatus schedule;
};

// Keeps a leading '+' and the digits; empty when no digit remains.
std::string normalize_phone_number(const std::string& value);

// intake | voicemail | smart_auto; anything else becomes smart_auto.
std::string normalize_mode(const std::string& mode);

// Precedence: caller override, fixed mode, spam label, smart_auto.
RouteChoice determine_route_for_mode(const std::string& mode,
                                     const std::optional<CallerRecord>& caller,
                                     const ScheduleStatus& schedule,
                                     const std::string& after_hours_mode = "voicemail");

class RoutingEngine {
public:
    explicit RoutingEngine(std::shared_ptr<AccountDirectory> directory);

    RoutingDecision decide(const std::string& to_number,
                           const std::string& from_number,
                           std::chrono::system_clock::time_point now =
                               std::chrono::system_clock::now());

private:
    RoutingDecision evaluate(const std::string& to_number,
                             const std::string& from_number,
                             std::chrono::system_clock::time_point now);

    std::shared_ptr<AccountDirectory> directory_;
};

}
