#include <catch2/catch_test_macros.hpp>

#include "receptionist/config.hpp"
#include "receptionist/logging.hpp"
#include "receptionist/metrics.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

TEST_CASE("counters render in prometheus text format") {
    auto& metrics = receptionist::Metrics::instance();
    metrics.reset();
    metrics.increment_calls_started();
    metrics.record_routing_decision("intake", "smart_unknown");
    metrics.observe_latency("synthesis", 0.2);

    const auto text = metrics.render_prometheus();
    REQUIRE(text.find("# TYPE receptionist_calls_started_total counter") != std::string::npos);
    REQUIRE(text.find("receptionist_calls_started_total 1\n") != std::string::npos);
    REQUIRE(text.find("receptionist_routing_decisions_total{route=\"intake\",reason=\"smart_unknown\"} 1")
            != std::string::npos);
    REQUIRE(text.find("receptionist_latency_seconds_count{operation=\"synthesis\"} 1")
            != std::string::npos);
    REQUIRE(text.find("receptionist_latency_seconds_bucket{operation=\"synthesis\",le=\"+Inf\"} 1")
            != std::string::npos);
}

TEST_CASE("log fields are quoted when they contain separators") {
    using receptionist::logging::kv;
    REQUIRE(receptionist::logging::format_kv({kv("call_sid", "CA1"), kv("turns", 3)}) ==
            "call_sid=CA1, turns=3");
    REQUIRE(receptionist::logging::format_kv({kv("text", "that's all, thanks")}) ==
            "text=\"that's all, thanks\"");
    REQUIRE(receptionist::logging::format_kv({kv("enabled", true), kv("empty", "")}) ==
            "enabled=true, empty=\"\"");
}

TEST_CASE("config validation rejects unusable settings") {
    receptionist::Config config;
    config.backend_url = "https://backend.example.com";
    config.media_stream_url = "wss://rx.example.com/realtime/twilio";
    REQUIRE_NOTHROW(config.validate());

    auto missing_backend = config;
    missing_backend.backend_url.clear();
    REQUIRE_THROWS_AS(missing_backend.validate(), std::runtime_error);

    auto bad_rate = config;
    bad_rate.asr_sample_rate = 44100;
    REQUIRE_THROWS_AS(bad_rate.validate(), std::runtime_error);

    auto bad_frame = config;
    bad_frame.frame_duration_ms = 15;
    REQUIRE_THROWS_AS(bad_frame.validate(), std::runtime_error);

    auto intake_off = config;
    intake_off.conversation_enabled = false;
    intake_off.media_stream_url.clear();
    REQUIRE_NOTHROW(intake_off.validate());
}

TEST_CASE("config load reads numbers strictly from the environment") {
    setenv("BACKEND_URL", "https://backend.example.com", 1);
    setenv("ACK_DELAY_MS", "750", 1);
    setenv("INTERRUPTIONS_ARE_ALLOWED", " Yes ", 1);
    const auto config = receptionist::Config::load();
    REQUIRE(config.ack_delay_ms == 750);
    REQUIRE(config.interruptions_are_allowed);

    setenv("ACK_DELAY_MS", "20ms", 1);
    REQUIRE_THROWS_AS(receptionist::Config::load(), std::runtime_error);

    unsetenv("ACK_DELAY_MS");
    unsetenv("INTERRUPTIONS_ARE_ALLOWED");
    unsetenv("BACKEND_URL");
}
