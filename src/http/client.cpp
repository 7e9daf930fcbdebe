#include "receptionist/http/client.hpp"

#include <utility>

#include "receptionist/logging.hpp"
#include "receptionist/utils/http.hpp"

namespace receptionist {

namespace {

constexpr size_t kErrorSnippetLimit = 256;

}

HttpClient::HttpClient(std::string base_url,
                       httplib::Headers default_headers,
                       HttpRequestOptions options)
    : base_url_(std::move(base_url)),
      default_headers_(std::move(default_headers)),
      options_(options) {
    utils::parse_url(base_url_, scheme_, host_, port_, base_path_);
    if (host_.empty()) {
        throw HttpError("Invalid base URL: " + base_url_, 0);
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        throw HttpError("HTTPS requires CPPHTTPLIB_OPENSSL_SUPPORT", 0);
    }
#endif
}

template <typename Fn>
httplib::Result HttpClient::send(Fn&& fn) const {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        httplib::SSLClient client(host_, port_);
        apply_timeouts(client);
        return fn(client);
    }
#endif
    httplib::Client client(host_, port_);
    apply_timeouts(client);
    return fn(client);
}

nlohmann::json HttpClient::get_json(const std::string& path) {
    const auto full_path = build_path(path);
    const auto headers = merge_headers({{"Accept", "application/json"}});
    auto result = send([&](auto& client) { return client.Get(full_path, headers); });
    check_result(result, "GET", full_path);
    return parse_body(result->body);
}

std::optional<nlohmann::json> HttpClient::find_json(const std::string& path) {
    const auto full_path = build_path(path);
    const auto headers = merge_headers({{"Accept", "application/json"}});
    auto result = send([&](auto& client) { return client.Get(full_path, headers); });
    if (result && result->status == 404) {
        return std::nullopt;
    }
    check_result(result, "GET", full_path);
    return parse_body(result->body);
}

nlohmann::json HttpClient::post_json(const std::string& path, const nlohmann::json& body) {
    const auto full_path = build_path(path);
    const auto headers = merge_headers({{"Accept", "application/json"}});
    const auto payload = body.dump();
    auto result = send([&](auto& client) {
        return client.Post(full_path, headers, payload, "application/json");
    });
    check_result(result, "POST", full_path);
    return parse_body(result->body);
}

nlohmann::json HttpClient::put_json(const std::string& path, const nlohmann::json& body) {
    const auto full_path = build_path(path);
    const auto headers = merge_headers({{"Accept", "application/json"}});
    const auto payload = body.dump();
    auto result = send([&](auto& client) {
        return client.Put(full_path, headers, payload, "application/json");
    });
    check_result(result, "PUT", full_path);
    return parse_body(result->body);
}

HttpResponse HttpClient::post(const std::string& path,
                              const httplib::Headers& headers,
                              const std::string& body,
                              const std::string& content_type) {
    const auto full_path = build_path(path);
    const auto merged = merge_headers(headers);
    auto result = send([&](auto& client) {
        return client.Post(full_path, merged, body, content_type);
    });
    check_result(result, "POST", full_path);
    return {result->status, result->body, result->get_header_value("Content-Type")};
}

httplib::Headers HttpClient::merge_headers(const httplib::Headers& extra) const {
    auto headers = default_headers_;
    for (const auto& item : extra) {
        headers.erase(item.first);
    }
    headers.insert(extra.begin(), extra.end());
    return headers;
}

std::string HttpClient::build_path(const std::string& path) const {
    return utils::join_path(base_path_, path);
}

void HttpClient::check_result(const httplib::Result& result, const std::string& method,
                              const std::string& path) const {
    if (!result) {
        const auto reason = httplib::to_string(result.error());
        logging::warn(
            "HTTP request failed",
            {kv("method", method),
             kv("host", host_),
             kv("path", path),
             kv("error", reason)});
        throw HttpError(method + " " + path + " failed: " + reason, 0);
    }
    if (result->status < 200 || result->status >= 300) {
        const auto snippet = result->body.substr(0, kErrorSnippetLimit);
        logging::warn(
            "HTTP request rejected",
            {kv("method", method),
             kv("host", host_),
             kv("path", path),
             kv("status", result->status),
             kv("response", snippet)});
        throw HttpError(method + " " + path + " returned " + std::to_string(result->status) +
                            ": " + snippet,
                        result->status);
    }
}

nlohmann::json HttpClient::parse_body(const std::string& body) {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& ex) {
        throw HttpError(std::string("Invalid JSON response: ") + ex.what(), 0);
    }
}

}
