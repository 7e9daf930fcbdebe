#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace receptionist {
namespace audio {

// Writes queued mu-law clips to the transport one frame per frame duration.
// interrupt() drops the queue and the current clip; once it returns no frame of
// a dropped clip is written.
class PacedPlayer {
public:
    struct Callbacks {
        std::function<bool(const std::string& frame)> write_frame;
        std::function<bool(uint64_t clip_id)> write_mark;
        std::function<void(uint64_t clip_id)> on_clip_finished;
        std::function<void()> on_write_failed;
    };

    explicit PacedPlayer(Callbacks callbacks,
                         std::chrono::milliseconds frame_duration = std::chrono::milliseconds(20),
                         int sample_rate = 8000);
    ~PacedPlayer();

    PacedPlayer(const PacedPlayer&) = delete;
    PacedPlayer& operator=(const PacedPlayer&) = delete;

    void start();
    void stop();
    void enqueue(uint64_t clip_id, std::string audio);
    void interrupt();
    bool is_active() const;
    size_t frame_bytes() const;

private:
    struct Clip {
        uint64_t id = 0;
        std::string audio;
    };

    void run();
    bool play_clip(const Clip& clip, uint64_t epoch);
    bool write_guarded(uint64_t epoch, const std::function<bool()>& write);

    Callbacks callbacks_;
    std::chrono::milliseconds frame_duration_;
    size_t frame_bytes_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Clip> queue_;
    bool running_ = false;
    bool playing_ = false;
    std::atomic<uint64_t> epoch_{0};
    std::mutex write_mutex_;
    std::thread worker_;
};

}
}
