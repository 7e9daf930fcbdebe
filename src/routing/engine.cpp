#include "receptionist/routing/engine.hpp"

#include <cctype>

#include "receptionist/logging.hpp"
#include "receptionist/metrics.hpp"
#include "receptionist/utils/text.hpp"

namespace receptionist::routing {

const char* to_string(Route route) {
    return route == Route::Intake ? "intake" : "voicemail";
}

std::string normalize_phone_number(const std::string& value) {
    const auto trimmed = utils::trim(value);
    std::string digits;
    for (unsigned char ch : trimmed) {
        if (std::isdigit(ch)) {
            digits.push_back(static_cast<char>(ch));
        }
    }
    if (digits.empty()) {
        return "";
    }
    return (trimmed.front() == '+' ? "+" : "") + digits;
}

std::string normalize_mode(const std::string& mode) {
    const auto normalized = utils::to_lower(utils::trim(mode));
    if (normalized == "intake" || normalized == "voicemail" || normalized == "smart_auto") {
        return normalized;
    }
    return "smart_auto";
}

RouteChoice determine_route_for_mode(const std::string& mode,
                                     const std::optional<CallerRecord>& caller,
                                     const ScheduleStatus& schedule,
                                     const std::string& after_hours_mode) {
    if (caller) {
        const auto override_mode = utils::to_lower(caller->routing_override);
        if (override_mode == "intake") {
            return {Route::Intake, "caller_override_intake"};
        }
        if (override_mode == "voicemail") {
            return {Route::Voicemail, "caller_override_voicemail"};
        }
    }
    if (mode == "intake") {
        return {Route::Intake, "mode_intake"};
    }
    if (mode == "voicemail") {
        return {Route::Voicemail, "mode_voicemail"};
    }
    if (caller && utils::to_lower(caller->label) == "spam") {
        return {Route::Voicemail, "caller_spam"};
    }
    if (mode == "smart_auto") {
        if (!schedule.active && schedule.reason == "after_hours") {
            const auto route = utils::to_lower(after_hours_mode) == "intake" ? Route::Intake
                                                                             : Route::Voicemail;
            return {route, "after_hours_override"};
        }
        return caller ? RouteChoice{Route::Voicemail, "smart_known"}
                      : RouteChoice{Route::Intake, "smart_unknown"};
    }
    return {Route::Voicemail, "unhandled_mode"};
}

RoutingEngine::RoutingEngine(std::shared_ptr<AccountDirectory> directory)
    : directory_(std::move(directory)) {}

RoutingDecision RoutingEngine::decide(const std::string& to_number,
                                      const std::string& from_number,
                                      std::chrono::system_clock::time_point now) {
    auto decision = evaluate(to_number, from_number, now);
    Metrics::instance().record_routing_decision(to_string(decision.route), decision.reason);
    logging::info(
        "Routing decision",
        {kv("to", normalize_phone_number(to_number)),
         kv("from", normalize_phone_number(from_number)),
         kv("account_id", decision.account ? decision.account->id : std::string("-")),
         kv("route", to_string(decision.route)),
         kv("reason", decision.reason),
         kv("mode", decision.mode),
         kv("schedule", decision.schedule.reason)});
    return decision;
}

RoutingDecision RoutingEngine::evaluate(const std::string& to_number,
                                        const std::string& from_number,
                                        std::chrono::system_clock::time_point now) {
    RoutingDecision decision;
    const auto to = normalize_phone_number(to_number);
    const auto from = normalize_phone_number(from_number);

    if (to.empty()) {
        decision.reason = "missing_to_number";
        decision.fallback = true;
        return decision;
    }

    try {
        decision.account = directory_->find_account_by_number(to);
    } catch (const std::exception& ex) {
        logging::error(
            "Account lookup failed",
            {kv("to", to),
             kv("error", ex.what())});
    }
    if (!decision.account || decision.account->id.empty()) {
        decision.account.reset();
        decision.reason = "user_not_found";
        decision.fallback = true;
        return decision;
    }
    const auto& account_id = decision.account->id;

    std::optional<RoutingSettings> settings;
    try {
        settings = directory_->routing_settings(account_id);
    } catch (const std::exception& ex) {
        logging::error(
            "Routing settings lookup failed",
            {kv("account_id", account_id),
             kv("error", ex.what())});
    }

    if (settings && !settings->feature_enabled) {
        decision.feature_enabled = false;
        decision.mode = "voicemail";
        decision.reason = "feature_disabled";
        return decision;
    }

    std::optional<BusinessSchedule> schedule;
    if (settings && !settings->schedule.is_null()) {
        schedule = parse_schedule(settings->schedule, settings->schedule_timezone);
    }
    decision.schedule = evaluate_schedule(schedule, now);
    decision.mode = normalize_mode(settings ? settings->mode : "");

    if (!from.empty()) {
        try {
            decision.caller = directory_->find_caller(account_id, from);
        } catch (const std::exception& ex) {
            logging::warn(
                "Caller lookup failed",
                {kv("account_id", account_id),
                 kv("from", from),
                 kv("error", ex.what())});
        }
    }

    const auto choice = determine_route_for_mode(
        decision.mode, decision.caller, decision.schedule,
        settings ? settings->after_hours_mode : "voicemail");
    decision.route = choice.route;
    decision.reason = choice.reason;

    if (!from.empty()) {
        try {
            directory_->upsert_caller_seen(account_id, from, now);
        } catch (const std::exception& ex) {
            logging::warn(
                "Failed to record caller",
                {kv("account_id", account_id),
                 kv("from", from),
                 kv("error", ex.what())});
        }
    }
    return decision;
}

}
