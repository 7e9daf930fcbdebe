#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "receptionist/audio/player.hpp"
#include "receptionist/conversation/completion.hpp"
#include "receptionist/conversation/engine.hpp"
#include "receptionist/providers/speech.hpp"
#include "receptionist/transport/media_socket.hpp"
#include "receptionist/tts/speech_queue.hpp"
#include "receptionist/tts/synthesis_chain.hpp"
#include "receptionist/utils/channel.hpp"

namespace receptionist::conversation {

struct TranscriptReceived {
    providers::TranscriptEvent event;
};

struct GenerationFinished {
    uint64_t request_id = 0;
    std::optional<providers::GenerationResult> result;
    std::string error;
};

struct PlaybackFinished {
    uint64_t utterance_id = 0;
};

struct TransportClosed {};

using CallEvent = std::variant<TranscriptReceived,
                               GenerationFinished,
                               PlaybackFinished,
                               TransportClosed>;

struct CallActorDependencies {
    std::shared_ptr<providers::SpeechRecognizer> recognizer;
    std::shared_ptr<providers::TextGenerator> generator;
    std::shared_ptr<tts::SynthesisChain> synthesis;
    std::shared_ptr<CompletionSink> completion;
};

struct CallActorSettings {
    EngineSettings engine;
    std::chrono::milliseconds ack_delay{1000};
    std::chrono::milliseconds frame_duration{20};
    int asr_sample_rate = 16000;
    std::string asr_language = "en";
    int tts_max_inflight = 2;
    bool interruptions_are_allowed = false;
};

// One per media socket. A mailbox thread owns the conversation engine; every
// recognizer, generation and playback result reaches it as a CallEvent.
class CallActor : public ConversationHost, public transport::MediaCall {
public:
    CallActor(CallSession session,
              CallActorDependencies dependencies,
              CallActorSettings settings,
              std::shared_ptr<transport::MediaSocket> socket);
    ~CallActor() override;

    CallActor(const CallActor&) = delete;
    CallActor& operator=(const CallActor&) = delete;

    void start() override;
    // Inbound mu-law from the provider; called on the socket thread.
    void on_media(const std::string& mulaw) override;
    void on_mark(const std::string& name) override;
    // Synchronous teardown; safe to call more than once.
    void stop() override;

    bool is_speaking() const;
    const std::string& call_sid() const { return call_sid_; }

    uint64_t speak(const std::string& text) override;
    void stop_speaking() override;
    void begin_generation(uint64_t request_id,
                          const providers::GenerationRequest& request) override;
    void cancel_generation() override;
    void arm_ack_timer() override;
    void disarm_ack_timer() override;
    void close_transport() override;
    void publish_completion(const CompletionEvent& event) override;

private:
    void run();
    void dispatch(CallEvent& event);
    void fire_ack_timer_if_due(std::chrono::steady_clock::time_point now);
    void read_transcripts(providers::RecognitionStream* stream);
    void deliver_speech(uint64_t utterance_id, std::optional<std::string> audio);

    std::string call_sid_;
    std::string stream_sid_;
    CallActorDependencies dependencies_;
    CallActorSettings settings_;
    std::shared_ptr<transport::MediaSocket> socket_;
    std::shared_ptr<utils::Channel<CallEvent>> mailbox_;

    ConversationEngine engine_;
    audio::PacedPlayer player_;
    std::unique_ptr<tts::SpeechQueue> speech_queue_;

    // Mailbox-thread state.
    std::optional<std::chrono::steady_clock::time_point> ack_deadline_;
    providers::CancelFlag generation_cancel_;
    uint64_t next_utterance_id_ = 0;

    mutable std::mutex recognition_mutex_;
    std::unique_ptr<providers::RecognitionStream> recognition_;
    std::thread reader_;
    std::thread mailbox_thread_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> forwarding_{false};
    std::atomic<uint64_t> dropped_media_{0};
};

}
