#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace receptionist::session {

// Written by the inbound webhook, read by the media server once the provider
// opens the stream for the same call.
struct SessionParameters {
    std::string call_sid;
    std::string account_id;
    std::string from_number;
    std::string to_number;
    std::string business_name;
    std::string receptionist_mode = "ai_only";
    std::string greeting;
    std::string voice_option = "koala_warm";
    std::optional<std::string> custom_voice_id;
    std::vector<std::string> questions;
    std::vector<std::string> ack_library;
    std::string routing_reason;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
};

class SessionParameterCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit SessionParameterCache(std::chrono::seconds ttl, Clock clock = nullptr);

    void put(SessionParameters parameters);
    std::optional<SessionParameters> get(const std::string& call_sid);
    // Hands the parameters to exactly one media stream. Later claims for the
    // same call fail until release() or erase(); claimed entries never expire.
    std::optional<SessionParameters> claim(const std::string& call_sid);
    void release(const std::string& call_sid);
    bool is_claimed(const std::string& call_sid) const;
    void erase(const std::string& call_sid);
    size_t purge_expired();
    size_t size() const;

private:
    struct Entry {
        SessionParameters parameters;
        std::chrono::steady_clock::time_point stored_at;
        bool claimed = false;
    };

    std::chrono::steady_clock::time_point now() const;
    bool expired(const Entry& entry, std::chrono::steady_clock::time_point now) const;

    std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}
