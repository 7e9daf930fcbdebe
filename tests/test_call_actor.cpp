#include <catch2/catch_test_macros.hpp>

#include "receptionist/conversation/call_actor.hpp"
#include "receptionist/utils/channel.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace receptionist;

bool eventually(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

class FakeSocket : public transport::MediaSocket {
public:
    bool send_text(const std::string& payload) override {
        const auto frame = nlohmann::json::parse(payload);
        std::lock_guard<std::mutex> lock(mutex);
        const auto event = frame["event"].get<std::string>();
        if (event == "media") {
            ++media_frames;
        } else if (event == "mark") {
            marks.push_back(frame["mark"]["name"].get<std::string>());
        } else if (event == "clear") {
            ++clears;
        }
        return true;
    }
    void close(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex);
        closed = reason;
    }
    void reject(const std::string& reason) override { close(reason); }

    size_t mark_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return marks.size();
    }
    std::string closed_reason() {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    std::mutex mutex;
    int media_frames = 0;
    int clears = 0;
    std::vector<std::string> marks;
    std::string closed;
};

class FakeStream : public providers::RecognitionStream {
public:
    explicit FakeStream(std::shared_ptr<utils::Channel<providers::TranscriptEvent>> events,
                        std::shared_ptr<std::atomic<size_t>> audio_bytes)
        : events_(std::move(events)), audio_bytes_(std::move(audio_bytes)) {}

    void send_audio(const std::string& pcm) override { *audio_bytes_ += pcm.size(); }
    void finish() override { events_->close(); }
    void close() override { events_->close(); }
    std::optional<providers::TranscriptEvent> next_event() override { return events_->pop(); }

private:
    std::shared_ptr<utils::Channel<providers::TranscriptEvent>> events_;
    std::shared_ptr<std::atomic<size_t>> audio_bytes_;
};

class FakeRecognizer : public providers::SpeechRecognizer {
public:
    std::string name() const override { return "fake-asr"; }
    std::unique_ptr<providers::RecognitionStream> start(
        const providers::RecognitionOptions& options) override {
        sample_rate = options.sample_rate;
        return std::make_unique<FakeStream>(events, audio_bytes);
    }

    void say(const std::string& text) {
        events->push(providers::TranscriptEvent{text, providers::TranscriptKind::Final, 0.9});
    }

    void hear(const std::string& partial) {
        events->push(providers::TranscriptEvent{partial, providers::TranscriptKind::Interim, 0.4});
    }

    std::shared_ptr<utils::Channel<providers::TranscriptEvent>> events =
        std::make_shared<utils::Channel<providers::TranscriptEvent>>();
    std::shared_ptr<std::atomic<size_t>> audio_bytes = std::make_shared<std::atomic<size_t>>(0);
    int sample_rate = 0;
};

class FakeGenerator : public providers::TextGenerator {
public:
    std::string name() const override { return "fake-llm"; }
    providers::GenerationResult generate(const providers::GenerationRequest& request,
                                         const providers::CancelFlag&) override {
        std::this_thread::sleep_for(delay);
        ++calls;
        if (!request.allow_function_calls) {
            return providers::AssistantUtterance{"So that's a leaking tap in Newtown."};
        }
        return providers::AssistantUtterance{"Sure, which suburb are you in?"};
    }

    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};
};

class FakeSynthesizer : public providers::SpeechSynthesizer {
public:
    FakeSynthesizer() { catalog_.default_voice = "fake-voice"; }

    std::string name() const override { return "fake-tts"; }
    const providers::VoiceCatalog& voices() const override { return catalog_; }
    providers::AudioBuffer synthesize(const std::string&,
                                      const std::string&,
                                      const providers::AudioFormat&) override {
        // 40 ms of 8 kHz mu-law silence.
        return {{providers::AudioEncoding::Mulaw, 8000}, std::string(320, '\xFF')};
    }

private:
    providers::VoiceCatalog catalog_;
};

class RecordingSink : public conversation::CompletionSink {
public:
    void publish(const conversation::CompletionEvent& event) override { events.push(event); }

    utils::Channel<conversation::CompletionEvent> events;
};

struct Harness {
    std::shared_ptr<FakeSocket> socket = std::make_shared<FakeSocket>();
    std::shared_ptr<FakeRecognizer> recognizer = std::make_shared<FakeRecognizer>();
    std::shared_ptr<FakeGenerator> generator = std::make_shared<FakeGenerator>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    conversation::CallActorSettings settings;

    Harness() {
        settings.ack_delay = std::chrono::milliseconds(5000);
        settings.frame_duration = std::chrono::milliseconds(10);
        settings.engine.min_caller_turns_before_close = 1;
    }

    std::shared_ptr<conversation::CallActor> make_actor() {
        conversation::CallSession session;
        session.call_sid = "CA-actor";
        session.stream_sid = "MZ-actor";
        session.greeting = "Hi, thanks for calling! What can we help you with?";
        session.ack_library = conversation::default_ack_library();

        conversation::CallActorDependencies dependencies;
        dependencies.recognizer = recognizer;
        dependencies.generator = generator;
        dependencies.synthesis = std::make_shared<tts::SynthesisChain>(
            std::vector<std::shared_ptr<providers::SpeechSynthesizer>>{
                std::make_shared<FakeSynthesizer>()},
            nullptr, providers::AudioFormat{providers::AudioEncoding::Mulaw, 8000});
        dependencies.completion = sink;
        return std::make_shared<conversation::CallActor>(session, dependencies, settings, socket);
    }
};

}

TEST_CASE("the actor greets, answers a caller turn and publishes on hangup") {
    Harness harness;
    auto actor = harness.make_actor();
    actor->start();

    REQUIRE(eventually([&] { return harness.socket->mark_count() == 1; }));
    REQUIRE(eventually([&] { return !actor->is_speaking(); }));
    REQUIRE(harness.recognizer->sample_rate == 16000);

    actor->on_media(std::string(160, '\xFF'));
    REQUIRE(eventually([&] { return harness.recognizer->audio_bytes->load() == 640; }));

    harness.recognizer->say("I need a plumber for a leaking tap.");
    REQUIRE(eventually([&] { return harness.socket->mark_count() == 2; }));
    REQUIRE(harness.generator->calls == 1);

    actor->stop();
    const auto event = harness.sink->events.pop_until(std::chrono::steady_clock::now() +
                                                      std::chrono::seconds(2));
    REQUIRE(event);
    REQUIRE(event->termination_reason == "caller_hangup");
    REQUIRE(event->call_sid == "CA-actor");
    REQUIRE(event->turns.size() == 3);
    REQUIRE(harness.socket->closed_reason().empty());
    {
        std::lock_guard<std::mutex> lock(harness.socket->mutex);
        REQUIRE(harness.socket->marks[0] == "utterance-1");
        REQUIRE(harness.socket->media_frames >= 4);
    }
}

TEST_CASE("caller audio is dropped while the agent speaks") {
    Harness harness;
    harness.settings.frame_duration = std::chrono::milliseconds(200);
    auto actor = harness.make_actor();
    actor->start();

    REQUIRE(eventually([&] { return actor->is_speaking(); }));
    actor->on_media(std::string(160, '\xFF'));
    REQUIRE(harness.recognizer->audio_bytes->load() == 0);
    actor->stop();
}

TEST_CASE("a completion phrase ends the call with a sign-off and closes the socket") {
    Harness harness;
    auto actor = harness.make_actor();
    actor->start();
    REQUIRE(eventually([&] { return harness.socket->mark_count() == 1; }));

    harness.recognizer->say("Leaking tap in Newtown.");
    REQUIRE(eventually([&] { return harness.socket->mark_count() == 2; }));
    REQUIRE(eventually([&] { return !actor->is_speaking(); }));

    harness.recognizer->say("That's all, thanks.");
    REQUIRE(eventually([&] { return harness.socket->closed_reason() == "conversation complete"; }));
    REQUIRE(harness.socket->mark_count() == 4);

    const auto event = harness.sink->events.pop_until(std::chrono::steady_clock::now() +
                                                      std::chrono::seconds(2));
    REQUIRE(event);
    REQUIRE(event->termination_reason == "completed");
    REQUIRE(event->turns.back().text ==
            std::string("Thanks for calling, the team will be in touch soon. Bye for now!"));

    actor->stop();
    REQUIRE_FALSE(harness.sink->events.try_pop());
}

TEST_CASE("a slow reply is covered by an acknowledgment") {
    Harness harness;
    harness.settings.ack_delay = std::chrono::milliseconds(20);
    harness.generator->delay = std::chrono::milliseconds(300);
    auto actor = harness.make_actor();
    actor->start();
    REQUIRE(eventually([&] { return harness.socket->mark_count() == 1; }));

    harness.recognizer->say("My hot water system stopped working this morning.");
    REQUIRE(eventually([&] { return harness.socket->mark_count() == 3; }));
    actor->stop();

    const auto event = harness.sink->events.pop_until(std::chrono::steady_clock::now() +
                                                      std::chrono::seconds(2));
    REQUIRE(event);
    // The acknowledgment is not part of the transcript.
    REQUIRE(event->turns.size() == 3);
}

TEST_CASE("a stream of interim results does not hold back the acknowledgment") {
    Harness harness;
    harness.settings.ack_delay = std::chrono::milliseconds(50);
    harness.generator->delay = std::chrono::milliseconds(1500);
    auto actor = harness.make_actor();
    actor->start();
    REQUIRE(eventually([&] { return harness.socket->mark_count() == 1; }));
    REQUIRE(eventually([&] { return !actor->is_speaking(); }));

    harness.recognizer->say("The power keeps tripping in the kitchen.");
    const auto flood_until = std::chrono::steady_clock::now() + std::chrono::milliseconds(400);
    while (std::chrono::steady_clock::now() < flood_until) {
        harness.recognizer->hear("and the lights flicker");
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    REQUIRE(eventually([&] { return harness.socket->mark_count() == 2; },
                       std::chrono::milliseconds(800)));
    REQUIRE(harness.generator->calls == 0);
    actor->stop();
}
