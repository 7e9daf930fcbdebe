#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "receptionist/conversation/acknowledgments.hpp"
#include "receptionist/conversation/completion.hpp"
#include "receptionist/conversation/session.hpp"
#include "receptionist/providers/speech.hpp"

namespace receptionist::conversation {

enum class ConversationState {
    Greeting,
    Listening,
    Thinking,
    Speaking,
    Closing,
    Closed,
};

const char* to_string(ConversationState state);

struct EngineSettings {
    size_t min_transcript_chars = 2;
    size_t barge_in_min_chars = 4;
    size_t min_caller_turns_before_close = 3;
};

// Side effects requested by the engine. Results come back through the
// engine's on_* methods, on the same thread that drives the engine.
class ConversationHost {
public:
    virtual ~ConversationHost() = default;

    // Queues text for synthesis and playback; the id is reported back through
    // on_playback_finished once the audio drained or was skipped.
    virtual uint64_t speak(const std::string& text) = 0;
    // Drops queued and playing audio; no further frame is written.
    virtual void stop_speaking() = 0;
    virtual void begin_generation(uint64_t request_id,
                                  const providers::GenerationRequest& request) = 0;
    virtual void cancel_generation() = 0;
    virtual void arm_ack_timer() = 0;
    virtual void disarm_ack_timer() = 0;
    virtual void close_transport() = 0;
    virtual void publish_completion(const CompletionEvent& event) = 0;
};

// Per-call turn-taking logic. Not thread safe; the call actor serializes all
// calls into it.
class ConversationEngine {
public:
    ConversationEngine(CallSession session,
                       ConversationHost& host,
                       EngineSettings settings = {},
                       AckRotator rotator = AckRotator());

    void start();
    void on_transcript(const providers::TranscriptEvent& event);
    void on_generation_result(uint64_t request_id, const providers::GenerationResult& result);
    void on_generation_failure(uint64_t request_id, const std::string& error);
    void on_ack_timer();
    void on_playback_finished(uint64_t utterance_id);
    void on_transport_closed();

    ConversationState state() const { return state_; }
    const CallSession& session() const { return session_; }
    bool is_closed() const { return state_ == ConversationState::Closed; }

private:
    void transition(ConversationState next);
    void handle_final(const std::string& text);
    void barge_in();
    void begin_thinking();
    void begin_closing();
    void respond(const std::string& text, const std::optional<nlohmann::json>& entities);
    void close_with(const std::string& summary);
    void finish(const std::string& reason, bool close_transport);
    uint64_t say(const std::string& text, const std::optional<nlohmann::json>& entities);
    void merge_entities(const nlohmann::json& arguments);
    providers::GenerationRequest build_request(bool allow_function_calls) const;
    bool is_current_request(uint64_t request_id) const;

    CallSession session_;
    ConversationHost& host_;
    EngineSettings settings_;
    AckRotator rotator_;

    ConversationState state_ = ConversationState::Greeting;
    uint64_t next_request_id_ = 0;
    std::optional<uint64_t> active_request_;
    std::optional<uint64_t> greeting_utterance_;
    std::set<uint64_t> outstanding_;
    bool ack_spoken_ = false;
    bool sign_off_queued_ = false;
    bool completion_published_ = false;
    std::string last_interim_;
};

}
