#include <catch2/catch_test_macros.hpp>

#include "receptionist/session/parameter_cache.hpp"

#include <chrono>
#include <string>

namespace {

receptionist::session::SessionParameters parameters_for(const std::string& call_sid) {
    receptionist::session::SessionParameters parameters;
    parameters.call_sid = call_sid;
    parameters.account_id = "acct-1";
    parameters.business_name = "Acme";
    return parameters;
}

}

TEST_CASE("session parameters are found by call sid until the ttl passes") {
    auto now = std::chrono::steady_clock::time_point{};
    receptionist::session::SessionParameterCache cache(std::chrono::seconds(60),
                                                       [&now] { return now; });
    cache.put(parameters_for("CA1"));

    now += std::chrono::seconds(59);
    const auto found = cache.get("CA1");
    REQUIRE(found);
    REQUIRE(found->business_name == "Acme");
    REQUIRE_FALSE(cache.get("CA2"));

    now += std::chrono::seconds(1);
    REQUIRE_FALSE(cache.get("CA1"));
    REQUIRE(cache.size() == 0);
}

TEST_CASE("parameters without a call sid are not cached") {
    receptionist::session::SessionParameterCache cache(std::chrono::seconds(60));
    cache.put(parameters_for(""));
    REQUIRE(cache.size() == 0);
}

TEST_CASE("purge_expired removes only stale entries") {
    auto now = std::chrono::steady_clock::time_point{};
    receptionist::session::SessionParameterCache cache(std::chrono::seconds(10),
                                                       [&now] { return now; });
    cache.put(parameters_for("old"));
    now += std::chrono::seconds(6);
    cache.put(parameters_for("new"));
    now += std::chrono::seconds(6);

    REQUIRE(cache.purge_expired() == 1);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get("new"));

    cache.erase("new");
    REQUIRE(cache.size() == 0);
}

TEST_CASE("only one claim succeeds and a claimed entry outlives the ttl") {
    auto now = std::chrono::steady_clock::time_point{};
    receptionist::session::SessionParameterCache cache(std::chrono::seconds(60),
                                                       [&now] { return now; });
    cache.put(parameters_for("CA1"));

    const auto claimed = cache.claim("CA1");
    REQUIRE(claimed);
    REQUIRE(claimed->account_id == "acct-1");
    REQUIRE_FALSE(cache.claim("CA1"));
    REQUIRE(cache.is_claimed("CA1"));

    cache.put(parameters_for("CA1"));
    REQUIRE(cache.is_claimed("CA1"));

    now += std::chrono::seconds(600);
    REQUIRE(cache.purge_expired() == 0);
    REQUIRE(cache.get("CA1"));

    cache.release("CA1");
    REQUIRE_FALSE(cache.is_claimed("CA1"));
    REQUIRE_FALSE(cache.claim("CA1"));
    REQUIRE(cache.size() == 0);
}
