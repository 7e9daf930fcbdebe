#include <catch2/catch_test_macros.hpp>

#include "receptionist/utils/http.hpp"

#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    const std::string input = "hello world!";
    const std::string expected = "hello%20world%21";
    REQUIRE(receptionist::utils::url_encode(input) == expected);
}

TEST_CASE("url_encode keeps a leading plus of a phone number escaped") {
    REQUIRE(receptionist::utils::url_encode("+61400111222") == "%2B61400111222");
}

TEST_CASE("parse_url splits scheme host port and path") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    receptionist::utils::parse_url("https://example.com:8443/path/file",
                                   scheme, host, port, base_path);
    REQUIRE(scheme == "https");
    REQUIRE(host == "example.com");
    REQUIRE(port == 8443);
    REQUIRE(base_path == "/path/file");
}

TEST_CASE("parse_url defaults secure websocket ports") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    receptionist::utils::parse_url("wss://api.deepgram.com/v1/listen", scheme, host, port,
                                   base_path);
    REQUIRE(scheme == "wss");
    REQUIRE(port == 443);
    REQUIRE(base_path == "/v1/listen");
}

TEST_CASE("join_path inserts exactly one separator") {
    REQUIRE(receptionist::utils::join_path("/v1", "chat/completions") == "/v1/chat/completions");
    REQUIRE(receptionist::utils::join_path("/v1/", "/chat") == "/v1/chat");
    REQUIRE(receptionist::utils::join_path("/", "health") == "/health");
}

TEST_CASE("parse_query decodes keys and values") {
    const auto query = receptionist::utils::parse_query("/realtime/twilio?callSid=CA%2012&flag");
    REQUIRE(query.at("callSid") == "CA 12");
    REQUIRE(query.at("flag").empty());
    REQUIRE(receptionist::utils::parse_query("/realtime/twilio").empty());
}
