#include "receptionist/server/inbound_call.hpp"

#include "receptionist/logging.hpp"
#include "receptionist/server/twiml.hpp"
#include "receptionist/utils/http.hpp"

namespace receptionist::server {

InboundCallHandler::InboundCallHandler(std::shared_ptr<routing::RoutingEngine> routing,
                                       std::shared_ptr<routing::AccountDirectory> directory,
                                       std::shared_ptr<session::SessionParameterCache> sessions,
                                       InboundSettings settings)
    : routing_(std::move(routing)),
      directory_(std::move(directory)),
      sessions_(std::move(sessions)),
      settings_(std::move(settings)) {}

std::string InboundCallHandler::url(const std::string& path) const {
    if (settings_.public_url.empty()) {
        return path;
    }
    auto base = settings_.public_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

std::string InboundCallHandler::voicemail(const std::string& greeting) const {
    return voicemail_twiml(greeting, url("/telephony/recording-complete"));
}

std::string InboundCallHandler::handle(const InboundCall& call) {
    try {
        if (call.stage == "choice") {
            return handle_choice(call);
        }
        return route(call);
    } catch (const std::exception& ex) {
        logging::error(
            "Inbound call handling failed; falling back to voicemail",
            {kv("call_sid", call.call_sid),
             kv("stage", call.stage),
             kv("error", ex.what())});
        return voicemail();
    }
}

std::string InboundCallHandler::route(const InboundCall& call) {
    const auto decision = routing_->decide(call.to_number, call.from_number);
    if (decision.route == routing::Route::Voicemail || !decision.account) {
        return voicemail();
    }
    const auto& account = *decision.account;
    const auto& profile = account.receptionist;

    if (!settings_.conversation_enabled || !profile.configured ||
        profile.mode == "voicemail_only") {
        logging::info(
            "Receptionist unavailable; sending to voicemail",
            {kv("call_sid", call.call_sid),
             kv("account_id", account.id),
             kv("configured", profile.configured),
             kv("mode", profile.mode)});
        return voicemail(profile.greeting);
    }

    if (profile.mode == "hybrid_choice") {
        const auto choice_url = url("/telephony/inbound-voice?stage=choice");
        return hybrid_choice_twiml(profile.greeting, choice_url,
                                   choice_url + "&decision=voicemail");
    }
    return answer_with_receptionist(call, account, decision.reason);
}

std::string InboundCallHandler::handle_choice(const InboundCall& call) {
    if (call.decision == "voicemail") {
        return voicemail();
    }
    const auto to = routing::normalize_phone_number(call.to_number);
    std::optional<routing::Account> account;
    if (!to.empty()) {
        account = directory_->find_account_by_number(to);
    }
    if (!account) {
        logging::warn(
            "No account for hybrid choice; sending to voicemail",
            {kv("call_sid", call.call_sid),
             kv("to", to)});
        return voicemail();
    }
    const auto choice = interpret_hybrid_choice(call.digits, call.speech_result);
    logging::info(
        "Hybrid choice",
        {kv("call_sid", call.call_sid),
         kv("digits", call.digits),
         kv("speech", call.speech_result),
         kv("choice", choice == HybridChoice::Voicemail ? "voicemail" : "receptionist")});
    if (choice == HybridChoice::Voicemail || !settings_.conversation_enabled) {
        return voicemail(account->receptionist.greeting);
    }
    return answer_with_receptionist(call, *account, "hybrid_choice");
}

std::string InboundCallHandler::answer_with_receptionist(const InboundCall& call,
                                                         const routing::Account& account,
                                                         const std::string& reason) {
    if (call.call_sid.empty()) {
        logging::warn(
            "Inbound call without CallSid; cannot stream",
            {kv("account_id", account.id)});
        return voicemail(account.receptionist.greeting);
    }
    const auto& profile = account.receptionist;
    session::SessionParameters parameters;
    parameters.call_sid = call.call_sid;
    parameters.account_id = account.id;
    parameters.from_number = routing::normalize_phone_number(call.from_number);
    parameters.to_number = routing::normalize_phone_number(call.to_number);
    parameters.business_name = account.business_name;
    parameters.receptionist_mode = profile.mode;
    parameters.greeting = profile.greeting;
    parameters.voice_option = profile.voice_option;
    parameters.custom_voice_id = profile.custom_voice_id;
    parameters.questions = profile.questions;
    parameters.ack_library = profile.ack_library;
    parameters.routing_reason = reason;
    sessions_->put(std::move(parameters));

    logging::info(
        "Connecting caller to receptionist",
        {kv("call_sid", call.call_sid),
         kv("account_id", account.id),
         kv("stream_url", settings_.media_stream_url),
         kv("questions", profile.questions.size())});
    return connect_stream_twiml(settings_.media_stream_url, call.call_sid, account.id);
}

}
