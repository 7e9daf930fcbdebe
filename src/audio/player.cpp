#include "receptionist/audio/player.hpp"

#include <algorithm>

#include "receptionist/logging.hpp"

namespace receptionist {
namespace audio {

PacedPlayer::PacedPlayer(Callbacks callbacks,
                         std::chrono::milliseconds frame_duration,
                         int sample_rate)
    : callbacks_(std::move(callbacks)),
      frame_duration_(frame_duration),
      frame_bytes_(static_cast<size_t>(sample_rate) *
                   static_cast<size_t>(frame_duration.count()) / 1000) {}

PacedPlayer::~PacedPlayer() {
    stop();
}

void PacedPlayer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread([this]() { run(); });
}

void PacedPlayer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        queue_.clear();
        ++epoch_;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void PacedPlayer::enqueue(uint64_t clip_id, std::string audio) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        queue_.push_back({clip_id, std::move(audio)});
    }
    cv_.notify_all();
}

void PacedPlayer::interrupt() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = queue_.size() + (playing_ ? 1 : 0);
        queue_.clear();
        ++epoch_;
    }
    cv_.notify_all();
    // Waits out a frame write that started before the epoch changed.
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    logging::debug(
        "Playback interrupted",
        {kv("dropped_clips", dropped)});
}

bool PacedPlayer::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return playing_ || !queue_.empty();
}

size_t PacedPlayer::frame_bytes() const {
    return frame_bytes_;
}

void PacedPlayer::run() {
    while (true) {
        Clip clip;
        uint64_t epoch = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
            if (!running_) {
                return;
            }
            clip = std::move(queue_.front());
            queue_.pop_front();
            epoch = epoch_.load();
            playing_ = true;
        }

        const bool completed = play_clip(clip, epoch);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            playing_ = false;
        }
        if (completed && callbacks_.on_clip_finished) {
            callbacks_.on_clip_finished(clip.id);
        }
    }
}

bool PacedPlayer::play_clip(const Clip& clip, uint64_t epoch) {
    auto deadline = std::chrono::steady_clock::now();
    for (size_t offset = 0; offset < clip.audio.size(); offset += frame_bytes_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            const bool cancelled = cv_.wait_until(lock, deadline, [this, epoch]() {
                return !running_ || epoch_.load() != epoch;
            });
            if (cancelled) {
                return false;
            }
        }
        const auto frame = clip.audio.substr(offset, std::min(frame_bytes_,
                                                              clip.audio.size() - offset));
        if (!write_guarded(epoch, [this, &frame]() { return callbacks_.write_frame(frame); })) {
            return false;
        }
        deadline += frame_duration_;
    }
    if (callbacks_.write_mark) {
        return write_guarded(epoch, [this, &clip]() { return callbacks_.write_mark(clip.id); });
    }
    return epoch_.load() == epoch;
}

bool PacedPlayer::write_guarded(uint64_t epoch, const std::function<bool()>& write) {
    bool ok = false;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        if (epoch_.load() != epoch) {
            return false;
        }
        ok = write();
    }
    if (!ok) {
        logging::warn("Transport write failed during playback");
        if (callbacks_.on_write_failed) {
            callbacks_.on_write_failed();
        }
    }
    return ok;
}

}
}
