#pragma once

#include <chrono>
#include <httplib.h>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace receptionist {

class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& message, int status)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

struct HttpRequestOptions {
    std::chrono::milliseconds request_timeout{10000};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{10000};
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::string content_type;
};

// Blocking JSON/binary client for one base URL. Non-2xx answers raise HttpError.
class HttpClient {
public:
    HttpClient(std::string base_url,
               httplib::Headers default_headers,
               HttpRequestOptions options);

    nlohmann::json get_json(const std::string& path);
    // 404 maps to nullopt.
    std::optional<nlohmann::json> find_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json put_json(const std::string& path, const nlohmann::json& body);
    HttpResponse post(const std::string& path,
                      const httplib::Headers& headers,
                      const std::string& body,
                      const std::string& content_type);

    const std::string& base_url() const { return base_url_; }

private:
    template <typename Client>
    void apply_timeouts(Client& client) const {
        client.set_connection_timeout(options_.connect_timeout);
        client.set_read_timeout(options_.read_timeout);
        client.set_write_timeout(options_.request_timeout);
    }

    template <typename Fn>
    httplib::Result send(Fn&& fn) const;

    httplib::Headers merge_headers(const httplib::Headers& extra) const;
    std::string build_path(const std::string& path) const;
    void check_result(const httplib::Result& result, const std::string& method,
                      const std::string& path) const;
    static nlohmann::json parse_body(const std::string& body);

    std::string base_url_;
    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    httplib::Headers default_headers_;
    HttpRequestOptions options_;
};

}
