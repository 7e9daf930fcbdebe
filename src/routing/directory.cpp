#include "receptionist/routing/directory.hpp"

#include "receptionist/http/client.hpp"
#include "receptionist/utils/http.hpp"
#include "receptionist/utils/time.hpp"

namespace receptionist::routing {

namespace {

std::string string_or(const nlohmann::json& value, const char* key, const std::string& fallback) {
    const auto it = value.find(key);
    if (it == value.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& value, const char* key) {
    const auto it = value.find(key);
    if (it == value.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::vector<std::string> string_list(const nlohmann::json& value, const char* key) {
    std::vector<std::string> items;
    const auto it = value.find(key);
    if (it == value.end() || !it->is_array()) {
        return items;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

}

Account account_from_json(const nlohmann::json& value) {
    Account account;
    account.id = string_or(value, "id", "");
    account.business_name = string_or(value, "business_name", "");

    auto& profile = account.receptionist;
    const auto configured = value.find("receptionist_configured");
    profile.configured = configured != value.end() && configured->is_boolean() &&
                         configured->get<bool>();
    profile.mode = string_or(value, "receptionist_mode", profile.mode);
    profile.greeting = string_or(value, "receptionist_greeting", "");
    profile.voice_option = string_or(value, "receptionist_voice", profile.voice_option);
    profile.custom_voice_id = optional_string(value, "receptionist_voice_id");
    profile.questions = string_list(value, "receptionist_questions");
    profile.ack_library = string_list(value, "receptionist_ack_library");
    return account;
}

RoutingSettings routing_settings_from_json(const nlohmann::json& value) {
    RoutingSettings settings;
    settings.mode = string_or(value, "mode", settings.mode);
    settings.after_hours_mode = string_or(value, "after_hours_mode", settings.after_hours_mode);
    const auto schedule = value.find("schedule");
    if (schedule != value.end()) {
        settings.schedule = *schedule;
    }
    settings.schedule_timezone = string_or(value, "schedule_timezone", "");
    const auto enabled = value.find("feature_enabled");
    if (enabled != value.end() && enabled->is_boolean()) {
        settings.feature_enabled = enabled->get<bool>();
    }
    return settings;
}

CallerRecord caller_from_json(const nlohmann::json& value) {
    CallerRecord caller;
    caller.account_id = string_or(value, "account_id", "");
    caller.phone_number = string_or(value, "phone_number", "");
    caller.label = string_or(value, "label", caller.label);
    caller.display_name = string_or(value, "display_name", "");
    caller.routing_override = string_or(value, "routing_override", caller.routing_override);
    caller.first_seen_at = string_or(value, "first_seen_at", "");
    caller.last_seen_at = string_or(value, "last_seen_at", "");
    return caller;
}

BackendDirectory::BackendDirectory(std::shared_ptr<HttpClient> client)
    : client_(std::move(client)) {}

std::optional<Account> BackendDirectory::find_account_by_number(const std::string& phone_number) {
    auto body = client_->find_json("/accounts/by-number/" + utils::url_encode(phone_number));
    if (!body || !body->is_object()) {
        return std::nullopt;
    }
    auto account = account_from_json(*body);
    if (account.id.empty()) {
        return std::nullopt;
    }
    return account;
}

std::optional<RoutingSettings> BackendDirectory::routing_settings(const std::string& account_id) {
    auto body = client_->find_json("/accounts/" + utils::url_encode(account_id) +
                                   "/routing-settings");
    if (!body || !body->is_object()) {
        return std::nullopt;
    }
    return routing_settings_from_json(*body);
}

std::optional<CallerRecord> BackendDirectory::find_caller(const std::string& account_id,
                                                          const std::string& phone_number) {
    auto body = client_->find_json("/accounts/" + utils::url_encode(account_id) + "/callers/" +
                                   utils::url_encode(phone_number));
    if (!body || !body->is_object()) {
        return std::nullopt;
    }
    return caller_from_json(*body);
}

void BackendDirectory::upsert_caller_seen(const std::string& account_id,
                                          const std::string& phone_number,
                                          std::chrono::system_clock::time_point seen_at) {
    client_->put_json("/accounts/" + utils::url_encode(account_id) + "/callers/" +
                          utils::url_encode(phone_number),
                      {{"last_seen_at", utils::format_timestamp(seen_at)}});
}

}
