#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace receptionist {
class HttpClient;
}

namespace receptionist::routing {

struct ReceptionistProfile {
    bool configured = false;
    // ai_only | hybrid_choice | voicemail_only
    std::string mode = "ai_only";
    std::string greeting;
    std::string voice_option = "koala_warm";
    std::optional<std::string> custom_voice_id;
    std::vector<std::string> questions;
    std::vector<std::string> ack_library;
};

struct Account {
    std::string id;
    std::string business_name;
    ReceptionistProfile receptionist;
};

struct RoutingSettings {
    // intake | voicemail | smart_auto; normalized by the routing engine.
    std::string mode = "smart_auto";
    std::string after_hours_mode = "voicemail";
    nlohmann::json schedule;
    std::string schedule_timezone;
    bool feature_enabled = true;
};

struct CallerRecord {
    std::string account_id;
    std::string phone_number;
    // lead | client | personal | spam
    std::string label = "lead";
    std::string display_name;
    // intake | voicemail | auto
    std::string routing_override = "auto";
    std::string first_seen_at;
    std::string last_seen_at;
};

Account account_from_json(const nlohmann::json& value);
RoutingSettings routing_settings_from_json(const nlohmann::json& value);
CallerRecord caller_from_json(const nlohmann::json& value);

// Read access to accounts and caller memory. Implementations may throw; the
// routing engine treats any failure as "absent".
class AccountDirectory {
public:
    virtual ~AccountDirectory() = default;
    virtual std::optional<Account> find_account_by_number(const std::string& phone_number) = 0;
    virtual std::optional<RoutingSettings> routing_settings(const std::string& account_id) = 0;
    virtual std::optional<CallerRecord> find_caller(const std::string& account_id,
                                                    const std::string& phone_number) = 0;
    virtual void upsert_caller_seen(const std::string& account_id,
                                    const std::string& phone_number,
                                    std::chrono::system_clock::time_point seen_at) = 0;
};

class BackendDirectory : public AccountDirectory {
public:
    explicit BackendDirectory(std::shared_ptr<HttpClient> client);

    std::optional<Account> find_account_by_number(const std::string& phone_number) override;
    std::optional<RoutingSettings> routing_settings(const std::string& account_id) override;
    std::optional<CallerRecord> find_caller(const std::string& account_id,
                                            const std::string& phone_number) override;
    void upsert_caller_seen(const std::string& account_id,
                            const std::string& phone_number,
                            std::chrono::system_clock::time_point seen_at) override;

private:
    std::shared_ptr<HttpClient> client_;
};

}
