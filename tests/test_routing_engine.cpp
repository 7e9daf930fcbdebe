#include <catch2/catch_test_macros.hpp>

#include "receptionist/metrics.hpp"
#include "receptionist/routing/engine.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using receptionist::routing::Account;
using receptionist::routing::CallerRecord;
using receptionist::routing::Route;
using receptionist::routing::RoutingSettings;
using receptionist::routing::ScheduleStatus;

class FakeDirectory : public receptionist::routing::AccountDirectory {
public:
    std::optional<Account> find_account_by_number(const std::string& phone_number) override {
        looked_up_number = phone_number;
        if (fail_account) {
            throw std::runtime_error("backend down");
        }
        return account;
    }

    std::optional<RoutingSettings> routing_settings(const std::string&) override {
        if (fail_settings) {
            throw std::runtime_error("backend down");
        }
        return settings;
    }

    std::optional<CallerRecord> find_caller(const std::string&,
                                            const std::string& phone_number) override {
        const auto it = callers.find(phone_number);
        if (it == callers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void upsert_caller_seen(const std::string&,
                            const std::string& phone_number,
                            std::chrono::system_clock::time_point) override {
        if (fail_upsert) {
            throw std::runtime_error("write failed");
        }
        seen.push_back(phone_number);
    }

    std::optional<Account> account;
    std::optional<RoutingSettings> settings;
    std::map<std::string, CallerRecord> callers;
    std::vector<std::string> seen;
    std::string looked_up_number;
    bool fail_account = false;
    bool fail_settings = false;
    bool fail_upsert = false;
};

std::shared_ptr<FakeDirectory> directory_with_account() {
    auto directory = std::make_shared<FakeDirectory>();
    Account account;
    account.id = "acct-1";
    account.business_name = "Acme";
    directory->account = account;
    directory->settings = RoutingSettings{};
    return directory;
}

CallerRecord caller(const std::string& label, const std::string& routing_override = "auto") {
    CallerRecord record;
    record.account_id = "acct-1";
    record.phone_number = "+61400111222";
    record.label = label;
    record.routing_override = routing_override;
    return record;
}

ScheduleStatus open_hours() {
    return ScheduleStatus{true, "within_business_hours", std::string("UTC")};
}

ScheduleStatus closed_hours() {
    return ScheduleStatus{false, "after_hours", std::string("UTC")};
}

std::chrono::system_clock::time_point monday_at(int hour) {
    return absl::ToChronoTime(
        absl::FromCivil(absl::CivilMinute(2024, 6, 3, hour, 0), absl::UTCTimeZone()));
}

}

TEST_CASE("phone numbers keep a leading plus and digits only") {
    using receptionist::routing::normalize_phone_number;
    REQUIRE(normalize_phone_number(" +61 (400) 111-222 ") == "+61400111222");
    REQUIRE(normalize_phone_number("0400 111 222") == "0400111222");
    REQUIRE(normalize_phone_number("anonymous").empty());
    REQUIRE(normalize_phone_number("+").empty());
}

TEST_CASE("unknown routing modes become smart_auto") {
    using receptionist::routing::normalize_mode;
    REQUIRE(normalize_mode(" Intake ") == "intake");
    REQUIRE(normalize_mode("voicemail") == "voicemail");
    REQUIRE(normalize_mode("whatever") == "smart_auto");
    REQUIRE(normalize_mode("") == "smart_auto");
}

TEST_CASE("route precedence follows override then mode then spam then schedule") {
    using receptionist::routing::determine_route_for_mode;

    auto choice = determine_route_for_mode("voicemail", caller("client", "intake"), open_hours());
    REQUIRE(choice.route == Route::Intake);
    REQUIRE(choice.reason == "caller_override_intake");

    choice = determine_route_for_mode("intake", caller("lead", "voicemail"), open_hours());
    REQUIRE(choice.route == Route::Voicemail);
    REQUIRE(choice.reason == "caller_override_voicemail");

    choice = determine_route_for_mode("intake", caller("spam"), open_hours());
    REQUIRE(choice.reason == "mode_intake");

    choice = determine_route_for_mode("voicemail", std::nullopt, open_hours());
    REQUIRE(choice.reason == "mode_voicemail");

    choice = determine_route_for_mode("smart_auto", caller("spam"), closed_hours(), "intake");
    REQUIRE(choice.route == Route::Voicemail);
    REQUIRE(choice.reason == "caller_spam");

    choice = determine_route_for_mode("smart_auto", std::nullopt, closed_hours());
    REQUIRE(choice.route == Route::Voicemail);
    REQUIRE(choice.reason == "after_hours_override");

    choice = determine_route_for_mode("smart_auto", std::nullopt, closed_hours(), "intake");
    REQUIRE(choice.route == Route::Intake);
    REQUIRE(choice.reason == "after_hours_override");

    choice = determine_route_for_mode("smart_auto", caller("client"), open_hours());
    REQUIRE(choice.route == Route::Voicemail);
    REQUIRE(choice.reason == "smart_known");

    choice = determine_route_for_mode("smart_auto", std::nullopt, ScheduleStatus{});
    REQUIRE(choice.route == Route::Intake);
    REQUIRE(choice.reason == "smart_unknown");

    choice = determine_route_for_mode("something_else", std::nullopt, open_hours());
    REQUIRE(choice.route == Route::Voicemail);
    REQUIRE(choice.reason == "unhandled_mode");
}

TEST_CASE("a missing destination number falls back to voicemail") {
    auto directory = directory_with_account();
    receptionist::routing::RoutingEngine engine(directory);
    const auto decision = engine.decide("", "+61400111222");
    REQUIRE(decision.route == Route::Voicemail);
    REQUIRE(decision.reason == "missing_to_number");
    REQUIRE(decision.fallback);
    REQUIRE(directory->looked_up_number.empty());
}

TEST_CASE("an unknown or failing account lookup routes to voicemail") {
    auto directory = std::make_shared<FakeDirectory>();
    receptionist::routing::RoutingEngine engine(directory);
    auto decision = engine.decide("+61 2 9999 0000", "+61400111222");
    REQUIRE(decision.reason == "user_not_found");
    REQUIRE(directory->looked_up_number == "+61299990000");

    directory->fail_account = true;
    decision = engine.decide("+61299990000", "+61400111222");
    REQUIRE(decision.reason == "user_not_found");
    REQUIRE_FALSE(decision.account);
}

TEST_CASE("a disabled feature routes to voicemail without touching callers") {
    auto directory = directory_with_account();
    directory->settings->feature_enabled = false;
    receptionist::routing::RoutingEngine engine(directory);
    const auto decision = engine.decide("+61299990000", "+61400111222");
    REQUIRE(decision.route == Route::Voicemail);
    REQUIRE(decision.reason == "feature_disabled");
    REQUIRE_FALSE(decision.feature_enabled);
    REQUIRE(directory->seen.empty());
}

TEST_CASE("first-time callers get intake and are remembered") {
    receptionist::Metrics::instance().reset();
    auto directory = directory_with_account();
    receptionist::routing::RoutingEngine engine(directory);

    const auto first = engine.decide("+61299990000", "+61400111222", monday_at(10));
    REQUIRE(first.route == Route::Intake);
    REQUIRE(first.reason == "smart_unknown");
    REQUIRE(first.mode == "smart_auto");
    REQUIRE(directory->seen == std::vector<std::string>{"+61400111222"});
    REQUIRE(receptionist::Metrics::instance().counter_value(
                "receptionist_routing_decisions_total",
                "route=\"intake\",reason=\"smart_unknown\"") == 1);

    directory->callers["+61400111222"] = caller("lead");
    const auto second = engine.decide("+61299990000", "+61400111222", monday_at(10));
    REQUIRE(second.route == Route::Voicemail);
    REQUIRE(second.reason == "smart_known");
    REQUIRE(second.caller);
}

TEST_CASE("after hours uses the configured after-hours route") {
    auto directory = directory_with_account();
    directory->settings->schedule = {
        {"timezone", "UTC"},
        {"windows", {{{"start", "09:00"}, {"end", "17:00"}}}},
    };
    receptionist::routing::RoutingEngine engine(directory);

    auto decision = engine.decide("+61299990000", "+61400111222", monday_at(20));
    REQUIRE(decision.route == Route::Voicemail);
    REQUIRE(decision.reason == "after_hours_override");
    REQUIRE(decision.schedule.reason == "after_hours");

    directory->settings->after_hours_mode = "intake";
    decision = engine.decide("+61299990000", "+61400111555", monday_at(20));
    REQUIRE(decision.route == Route::Intake);

    decision = engine.decide("+61299990000", "+61400111777", monday_at(11));
    REQUIRE(decision.reason == "smart_unknown");
    REQUIRE(decision.schedule.active);
}

TEST_CASE("settings and upsert failures do not block routing") {
    auto directory = directory_with_account();
    directory->fail_settings = true;
    directory->fail_upsert = true;
    receptionist::routing::RoutingEngine engine(directory);

    const auto decision = engine.decide("+61299990000", "+61400111222");
    REQUIRE(decision.mode == "smart_auto");
    REQUIRE(decision.route == Route::Intake);
    REQUIRE(decision.reason == "smart_unknown");
}

TEST_CASE("anonymous callers skip caller memory") {
    auto directory = directory_with_account();
    directory->settings->mode = "intake";
    receptionist::routing::RoutingEngine engine(directory);

    const auto decision = engine.decide("+61299990000", "anonymous");
    REQUIRE(decision.route == Route::Intake);
    REQUIRE(decision.reason == "mode_intake");
    REQUIRE(directory->seen.empty());
}
