#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "receptionist/providers/speech.hpp"

namespace receptionist::tts {

// Synthesizes utterances concurrently (bounded by max_inflight) and hands the
// results to the deliver callback strictly in enqueue order. A failed
// synthesis is delivered as nullopt so the caller can treat it as finished.
// After cancel() returns no previously enqueued utterance is delivered.
class SpeechQueue {
public:
    using SynthFn = std::function<std::optional<std::string>(
        const std::string& text,
        const providers::CancelFlag& cancelled)>;
    using DeliverFn = std::function<void(uint64_t utterance_id,
                                         std::optional<std::string> audio)>;

    SpeechQueue(int max_inflight, SynthFn synth_fn, DeliverFn deliver_fn);
    ~SpeechQueue();

    SpeechQueue(const SpeechQueue&) = delete;
    SpeechQueue& operator=(const SpeechQueue&) = delete;

    void enqueue(uint64_t utterance_id, const std::string& text);
    void cancel();
    void shutdown();
    bool has_pending() const;

private:
    using Task = std::packaged_task<std::optional<std::string>()>;

    struct Entry {
        uint64_t id = 0;
        std::shared_future<std::optional<std::string>> future;
        providers::CancelFlag cancelled;
    };

    struct PendingTask {
        std::shared_ptr<Task> task;
        providers::CancelFlag cancelled;
    };

    // Outlives the queue object; synthesis threads hold a reference.
    struct State {
        size_t max_inflight = 1;
        SynthFn synth_fn;
        DeliverFn deliver_fn;

        mutable std::mutex mutex;
        std::deque<Entry> entries;
        std::deque<PendingTask> pending;
        size_t inflight = 0;
        bool delivering = false;
        bool closed = false;

        std::mutex delivery_mutex;
    };

    static void start_synthesis(const std::shared_ptr<State>& state);
    static void on_synthesis_finished(const std::shared_ptr<State>& state);
    static void deliver_ready(const std::shared_ptr<State>& state);
    static void cancel_locked(State& state);

    std::shared_ptr<State> state_;
};

}
