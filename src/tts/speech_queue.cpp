#include "receptionist/tts/speech_queue.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

#include "receptionist/logging.hpp"
#include "receptionist/utils/async.hpp"

namespace receptionist::tts {

SpeechQueue::SpeechQueue(int max_inflight, SynthFn synth_fn, DeliverFn deliver_fn)
    : state_(std::make_shared<State>()) {
    state_->max_inflight = static_cast<size_t>(std::max(1, max_inflight));
    state_->synth_fn = std::move(synth_fn);
    state_->deliver_fn = std::move(deliver_fn);
}

SpeechQueue::~SpeechQueue() {
    shutdown();
}

void SpeechQueue::enqueue(uint64_t utterance_id, const std::string& text) {
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    auto state = state_;
    auto task = std::make_shared<Task>(
        [state, text, cancelled]() -> std::optional<std::string> {
            if (providers::is_cancelled(cancelled)) {
                return std::nullopt;
            }
            return state->synth_fn(text, cancelled);
        });
    auto future = task->get_future().share();

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->closed) {
            logging::debug(
                "Speech queue closed; dropping utterance",
                {kv("utterance_id", utterance_id)});
            return;
        }
        state_->entries.push_back({utterance_id, future, cancelled});
        state_->pending.push_back({task, cancelled});
    }
    start_synthesis(state_);
}

void SpeechQueue::cancel_locked(State& state) {
    for (auto& entry : state.entries) {
        entry.cancelled->store(true);
    }
    for (auto& task : state.pending) {
        task.cancelled->store(true);
    }
    state.entries.clear();
    state.pending.clear();
}

void SpeechQueue::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        cancel_locked(*state_);
    }
    // Wait out a delivery that already popped its entry.
    std::lock_guard<std::mutex> barrier(state_->delivery_mutex);
}

void SpeechQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
        cancel_locked(*state_);
    }
    std::lock_guard<std::mutex> barrier(state_->delivery_mutex);
}

bool SpeechQueue::has_pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->entries.empty() || state_->delivering;
}

void SpeechQueue::start_synthesis(const std::shared_ptr<State>& state) {
    std::vector<PendingTask> to_start;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        while (state->inflight < state->max_inflight && !state->pending.empty()) {
            PendingTask task = std::move(state->pending.front());
            state->pending.pop_front();
            if (providers::is_cancelled(task.cancelled)) {
                continue;
            }
            ++state->inflight;
            to_start.push_back(std::move(task));
        }
    }

    for (auto& task : to_start) {
        utils::run_async(
            [state, task_ptr = task.task]() {
                (*task_ptr)();
                on_synthesis_finished(state);
            },
            "speech-synthesis");
    }
}

void SpeechQueue::on_synthesis_finished(const std::shared_ptr<State>& state) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->inflight > 0) {
            --state->inflight;
        }
    }
    deliver_ready(state);
    start_synthesis(state);
}

void SpeechQueue::deliver_ready(const std::shared_ptr<State>& state) {
    std::lock_guard<std::mutex> delivery(state->delivery_mutex);
    while (true) {
        Entry entry;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->entries.empty()) {
                return;
            }
            auto& front = state->entries.front();
            if (front.future.wait_for(std::chrono::seconds(0)) !=
                std::future_status::ready) {
                return;
            }
            entry = front;
            state->entries.pop_front();
            state->delivering = true;
        }

        std::optional<std::string> audio;
        try {
            audio = entry.future.get();
        } catch (const std::exception& ex) {
            logging::warn(
                "Utterance synthesis raised",
                {kv("utterance_id", entry.id),
                 kv("error", ex.what())});
        }

        if (!providers::is_cancelled(entry.cancelled) && state->deliver_fn) {
            state->deliver_fn(entry.id, std::move(audio));
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        state->delivering = false;
    }
}

}
