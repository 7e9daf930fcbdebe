#include "receptionist/server/twiml.hpp"

#include <sstream>

#include "receptionist/utils/http.hpp"
#include "receptionist/utils/text.hpp"

namespace receptionist::server {

namespace {

const char* const kXmlHeader = R"(<?xml version="1.0" encoding="UTF-8"?>)";
const char* const kDefaultVoicemailGreeting =
    "Hi, thanks for calling. Please leave your name, number and a short message after the beep.";
const char* const kDefaultChoiceGreeting = "Hi, thanks for calling the team.";

std::string attr(const std::string& value) {
    return utils::xml_escape(value);
}

}

std::string voicemail_twiml(const std::string& greeting, const std::string& recording_action_url) {
    const auto text = utils::trim(greeting).empty() ? std::string(kDefaultVoicemailGreeting)
                                                    : utils::trim(greeting);
    std::ostringstream out;
    out << kXmlHeader << "<Response>"
        << "<Say>" << utils::xml_escape(text) << "</Say>"
        << "<Record action=\"" << attr(recording_action_url)
        << "\" method=\"POST\" maxLength=\"120\" playBeep=\"true\"/>"
        << "</Response>";
    return out.str();
}

std::string hybrid_choice_twiml(const std::string& greeting,
                                const std::string& action_url,
                                const std::string& fallback_url) {
    const auto text = utils::trim(greeting).empty() ? std::string(kDefaultChoiceGreeting)
                                                    : utils::trim(greeting);
    std::ostringstream out;
    out << kXmlHeader << "<Response>"
        << "<Gather input=\"speech dtmf\" action=\"" << attr(action_url)
        << "\" method=\"POST\" numDigits=\"1\" timeout=\"5\" speechTimeout=\"auto\">"
        << "<Say>" << utils::xml_escape(text) << "</Say>"
        << "<Pause length=\"1\"/>"
        << "<Say>If you would like to leave a voicemail for the team, press 1 or say "
           "&quot;leave a message&quot;.</Say>"
        << "<Say>If you would like our receptionist to help you right now, press 2 or say "
           "&quot;talk to the receptionist&quot;.</Say>"
        << "</Gather>"
        << "<Say>Sorry, I didn&apos;t catch that. I&apos;ll transfer you to voicemail.</Say>"
        << "<Redirect method=\"POST\">" << utils::xml_escape(fallback_url) << "</Redirect>"
        << "</Response>";
    return out.str();
}

std::string connect_stream_twiml(const std::string& stream_url,
                                 const std::string& call_sid,
                                 const std::string& account_id) {
    auto url = stream_url;
    if (!call_sid.empty()) {
        url += (url.find('?') == std::string::npos ? "?" : "&");
        url += "callSid=" + utils::url_encode(call_sid);
    }
    std::ostringstream out;
    out << kXmlHeader << "<Response><Connect>"
        << "<Stream url=\"" << attr(url) << "\" track=\"inbound_track\">"
        << "<Parameter name=\"callSid\" value=\"" << attr(call_sid) << "\"/>"
        << "<Parameter name=\"userId\" value=\"" << attr(account_id) << "\"/>"
        << "</Stream></Connect></Response>";
    return out.str();
}

std::string recording_complete_twiml() {
    std::ostringstream out;
    out << kXmlHeader << "<Response>"
        << "<Say>Thanks, your message has been recorded. Goodbye.</Say>"
        << "<Hangup/></Response>";
    return out.str();
}

HybridChoice interpret_hybrid_choice(const std::string& digits, const std::string& speech) {
    const auto pressed = utils::trim(digits);
    if (pressed == "1") {
        return HybridChoice::Voicemail;
    }
    if (pressed == "2") {
        return HybridChoice::Receptionist;
    }
    const auto said = utils::to_lower(speech);
    if (said.find("message") != std::string::npos ||
        said.find("voicemail") != std::string::npos ||
        said.find("record") != std::string::npos) {
        return HybridChoice::Voicemail;
    }
    return HybridChoice::Receptionist;
}

}
