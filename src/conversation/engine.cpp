#include "receptionist/conversation/engine.hpp"

#include "receptionist/conversation/turn_heuristics.hpp"
#include "receptionist/logging.hpp"
#include "receptionist/metrics.hpp"
#include "receptionist/utils/text.hpp"

namespace receptionist::conversation {

const char* to_string(ConversationState state) {
    switch (state) {
        case ConversationState::Greeting:
            return "greeting";
        case ConversationState::Listening:
            return "listening";
        case ConversationState::Thinking:
            return "thinking";
        case ConversationState::Speaking:
            return "speaking";
        case ConversationState::Closing:
            return "closing";
        case ConversationState::Closed:
            return "closed";
    }
    return "unknown";
}

ConversationEngine::ConversationEngine(CallSession session,
                                       ConversationHost& host,
                                       EngineSettings settings,
                                       AckRotator rotator)
    : session_(std::move(session)),
      host_(host),
      settings_(settings),
      rotator_(std::move(rotator)) {}

void ConversationEngine::transition(ConversationState next) {
    if (state_ == next) {
        return;
    }
    logging::debug(
        "Conversation state change",
        {kv("call_sid", session_.call_sid),
         kv("from", to_string(state_)),
         kv("to", to_string(next))});
    state_ = next;
}

void ConversationEngine::start() {
    if (state_ != ConversationState::Greeting || greeting_utterance_) {
        return;
    }
    greeting_utterance_ = say(session_.greeting, std::nullopt);
    logging::info(
        "Conversation started",
        {kv("call_sid", session_.call_sid),
         kv("mode", to_string(session_.mode)),
         kv("questions", session_.questions.size())});
}

uint64_t ConversationEngine::say(const std::string& text,
                                 const std::optional<nlohmann::json>& entities) {
    ConversationTurn turn;
    turn.role = Role::Agent;
    turn.text = text;
    turn.entities = entities;
    session_.turns.push_back(std::move(turn));
    const auto id = host_.speak(text);
    outstanding_.insert(id);
    return id;
}

void ConversationEngine::on_transcript(const providers::TranscriptEvent& event) {
    const auto text = utils::trim(event.text);
    switch (state_) {
        case ConversationState::Closing:
        case ConversationState::Closed:
            return;
        case ConversationState::Greeting:
        case ConversationState::Speaking:
            if (event.kind == providers::TranscriptKind::Interim) {
                last_interim_ = text;
                if (text.size() > settings_.barge_in_min_chars) {
                    barge_in();
                }
                return;
            }
            if (!is_actionable_transcript(text, settings_.min_transcript_chars)) {
                return;
            }
            barge_in();
            handle_final(text);
            return;
        case ConversationState::Listening:
        case ConversationState::Thinking:
            if (event.kind == providers::TranscriptKind::Interim) {
                last_interim_ = text;
                return;
            }
            handle_final(text);
            return;
    }
}

void ConversationEngine::barge_in() {
    logging::info(
        "Caller barged in",
        {kv("call_sid", session_.call_sid),
         kv("state", to_string(state_))});
    host_.stop_speaking();
    outstanding_.clear();
    greeting_utterance_.reset();
    transition(ConversationState::Listening);
}

void ConversationEngine::handle_final(const std::string& text) {
    last_interim_.clear();
    if (!is_actionable_transcript(text, settings_.min_transcript_chars)) {
        logging::debug(
            "Ignoring non-actionable transcript",
            {kv("call_sid", session_.call_sid),
             kv("text", text)});
        return;
    }

    const auto prior_caller_turns = session_.caller_turn_count();
    ConversationTurn turn;
    turn.role = Role::Caller;
    turn.text = text;
    session_.turns.push_back(std::move(turn));

    if (active_request_) {
        host_.cancel_generation();
        host_.disarm_ack_timer();
        active_request_.reset();
    }

    if (prior_caller_turns >= settings_.min_caller_turns_before_close &&
        signals_completion(text)) {
        begin_closing();
        return;
    }
    begin_thinking();
}

providers::GenerationRequest ConversationEngine::build_request(bool allow_function_calls) const {
    providers::GenerationRequest request;
    request.system_prompt = session_.system_prompt;
    request.allow_function_calls = allow_function_calls;
    for (const auto& turn : session_.turns) {
        request.messages.push_back(
            {turn.role == Role::Caller ? "user" : "assistant", turn.text});
    }
    return request;
}

void ConversationEngine::begin_thinking() {
    transition(ConversationState::Thinking);
    active_request_ = ++next_request_id_;
    ack_spoken_ = false;
    host_.begin_generation(*active_request_, build_request(true));
    host_.arm_ack_timer();
}

void ConversationEngine::begin_closing() {
    transition(ConversationState::Closing);
    logging::info(
        "Caller signalled completion; closing",
        {kv("call_sid", session_.call_sid),
         kv("caller_turns", session_.caller_turn_count())});
    active_request_ = ++next_request_id_;
    auto request = build_request(false);
    request.messages.push_back({"system", kSummaryInstruction});
    host_.begin_generation(*active_request_, request);
}

bool ConversationEngine::is_current_request(uint64_t request_id) const {
    return active_request_ && *active_request_ == request_id;
}

void ConversationEngine::on_generation_result(uint64_t request_id,
                                              const providers::GenerationResult& result) {
    if (!is_current_request(request_id)) {
        logging::debug(
            "Dropping stale generation result",
            {kv("call_sid", session_.call_sid),
             kv("request_id", request_id)});
        return;
    }
    active_request_.reset();

    if (state_ == ConversationState::Closing) {
        std::string summary;
        if (const auto* utterance = std::get_if<providers::AssistantUtterance>(&result)) {
            summary = utterance->text;
        } else if (const auto* call = std::get_if<providers::FunctionCall>(&result)) {
            merge_entities(call->arguments);
            summary = call->spoken_text;
        }
        close_with(summary);
        return;
    }
    if (state_ != ConversationState::Thinking) {
        return;
    }
    host_.disarm_ack_timer();

    if (const auto* utterance = std::get_if<providers::AssistantUtterance>(&result)) {
        respond(utterance->text, std::nullopt);
        return;
    }
    const auto& call = std::get<providers::FunctionCall>(result);
    merge_entities(call.arguments);
    logging::info(
        "Entities captured",
        {kv("call_sid", session_.call_sid),
         kv("function", call.name),
         kv("fields", call.arguments.size())});
    auto text = utils::clean_for_speech(call.spoken_text);
    if (text.empty()) {
        text = next_question(session_).value_or(kFallbackUtterance);
    }
    respond(text, call.arguments);
}

void ConversationEngine::on_generation_failure(uint64_t request_id, const std::string& error) {
    if (!is_current_request(request_id)) {
        return;
    }
    active_request_.reset();
    logging::warn(
        "Generation failed; using fallback",
        {kv("call_sid", session_.call_sid),
         kv("state", to_string(state_)),
         kv("error", error)});
    if (state_ == ConversationState::Closing) {
        close_with("");
        return;
    }
    if (state_ != ConversationState::Thinking) {
        return;
    }
    host_.disarm_ack_timer();
    respond(kFallbackUtterance, std::nullopt);
}

void ConversationEngine::respond(const std::string& text,
                                 const std::optional<nlohmann::json>& entities) {
    auto reply = utils::clean_for_speech(text);
    if (reply.empty()) {
        reply = kFallbackUtterance;
    }
    say(reply, entities);
    transition(ConversationState::Speaking);
}

void ConversationEngine::close_with(const std::string& summary) {
    auto text = utils::clean_for_speech(summary);
    if (text.empty()) {
        text = kFallbackUtterance;
    }
    say(text, std::nullopt);
    say(kSignOff, std::nullopt);
    sign_off_queued_ = true;
}

void ConversationEngine::merge_entities(const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        return;
    }
    for (const auto& item : arguments.items()) {
        const auto& value = item.value();
        if (value.is_null() || (value.is_string() && value.get<std::string>().empty())) {
            continue;
        }
        session_.entities[item.key()] = value;
    }
}

void ConversationEngine::on_ack_timer() {
    if (state_ != ConversationState::Thinking || ack_spoken_ || !active_request_) {
        return;
    }
    const ConversationTurn* last_caller = nullptr;
    for (auto it = session_.turns.rbegin(); it != session_.turns.rend(); ++it) {
        if (it->role == Role::Caller) {
            last_caller = &*it;
            break;
        }
    }
    if (last_caller && ends_with_continuation(last_caller->text)) {
        logging::debug(
            "Skipping acknowledgment; caller mid-sentence",
            {kv("call_sid", session_.call_sid)});
        return;
    }
    ack_spoken_ = true;
    const auto phrase = rotator_.next(session_.ack_library, session_.ack_history);
    // Acknowledgments are filler; they stay out of the turn history.
    host_.speak(phrase);
}

void ConversationEngine::on_playback_finished(uint64_t utterance_id) {
    outstanding_.erase(utterance_id);
    if (state_ == ConversationState::Greeting && greeting_utterance_ &&
        *greeting_utterance_ == utterance_id) {
        greeting_utterance_.reset();
        transition(ConversationState::Listening);
        return;
    }
    if (!outstanding_.empty()) {
        return;
    }
    if (state_ == ConversationState::Speaking) {
        transition(ConversationState::Listening);
    } else if (state_ == ConversationState::Closing && sign_off_queued_) {
        finish("completed", true);
    }
}

void ConversationEngine::on_transport_closed() {
    if (state_ == ConversationState::Closed) {
        return;
    }
    if (active_request_) {
        host_.cancel_generation();
        active_request_.reset();
    }
    host_.disarm_ack_timer();
    finish("caller_hangup", false);
}

void ConversationEngine::finish(const std::string& reason, bool close_transport) {
    transition(ConversationState::Closed);
    if (completion_published_) {
        return;
    }
    completion_published_ = true;
    session_.completed_at = std::chrono::system_clock::now();
    session_.termination_reason = reason;
    logging::info(
        "Conversation finished",
        {kv("call_sid", session_.call_sid),
         kv("reason", reason),
         kv("turns", session_.turns.size())});
    Metrics::instance().increment_calls_completed(reason);
    host_.publish_completion(CompletionEvent::from_session(session_));
    if (close_transport) {
        host_.close_transport();
    }
}

}
