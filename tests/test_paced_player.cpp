#include <catch2/catch_test_macros.hpp>

#include "receptionist/audio/player.hpp"
#include "receptionist/utils/channel.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Recorder {
    std::mutex mutex;
    std::vector<std::string> frames;
    std::vector<uint64_t> marks;
    receptionist::utils::Channel<uint64_t> finished;
    std::atomic<int> failures{0};
    std::atomic<bool> fail_writes{false};

    receptionist::audio::PacedPlayer::Callbacks callbacks() {
        receptionist::audio::PacedPlayer::Callbacks cb;
        cb.write_frame = [this](const std::string& frame) {
            if (fail_writes) {
                return false;
            }
            std::lock_guard<std::mutex> lock(mutex);
            frames.push_back(frame);
            return true;
        };
        cb.write_mark = [this](uint64_t id) {
            std::lock_guard<std::mutex> lock(mutex);
            marks.push_back(id);
            return true;
        };
        cb.on_clip_finished = [this](uint64_t id) { finished.push(id); };
        cb.on_write_failed = [this]() { ++failures; };
        return cb;
    }

    size_t frame_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }
};

}

TEST_CASE("a clip is written as 20 ms frames followed by its mark") {
    Recorder recorder;
    receptionist::audio::PacedPlayer player(recorder.callbacks());
    REQUIRE(player.frame_bytes() == 160);
    player.start();

    player.enqueue(5, std::string(400, '\x7F'));
    const auto done = recorder.finished.pop_until(std::chrono::steady_clock::now() +
                                                  std::chrono::seconds(2));
    REQUIRE(done == std::optional<uint64_t>(5));
    {
        std::lock_guard<std::mutex> lock(recorder.mutex);
        REQUIRE(recorder.frames.size() == 3);
        REQUIRE(recorder.frames[0].size() == 160);
        REQUIRE(recorder.frames[2].size() == 80);
        REQUIRE(recorder.marks == std::vector<uint64_t>{5});
    }
    REQUIRE_FALSE(player.is_active());
    player.stop();
}

TEST_CASE("clips play back to back in order") {
    Recorder recorder;
    receptionist::audio::PacedPlayer player(recorder.callbacks(), std::chrono::milliseconds(5));
    player.start();
    player.enqueue(1, std::string(40, 'a'));
    player.enqueue(2, std::string(40, 'b'));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    REQUIRE(recorder.finished.pop_until(deadline) == std::optional<uint64_t>(1));
    REQUIRE(recorder.finished.pop_until(deadline) == std::optional<uint64_t>(2));
    player.stop();
}

TEST_CASE("no frame of an interrupted clip is written after interrupt returns") {
    Recorder recorder;
    receptionist::audio::PacedPlayer player(recorder.callbacks());
    player.start();
    player.enqueue(1, std::string(160 * 50, '\x7F'));
    player.enqueue(2, std::string(160 * 50, '\x7F'));

    std::this_thread::sleep_for(std::chrono::milliseconds(70));
    player.interrupt();
    const auto written = recorder.frame_count();
    REQUIRE(written > 0);
    REQUIRE(written < 50);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    REQUIRE(recorder.frame_count() == written);
    REQUIRE_FALSE(recorder.finished.pop_until(std::chrono::steady_clock::now() +
                                              std::chrono::milliseconds(50)));
    REQUIRE_FALSE(player.is_active());
    {
        std::lock_guard<std::mutex> lock(recorder.mutex);
        REQUIRE(recorder.marks.empty());
    }

    player.enqueue(3, std::string(160, '\x7F'));
    REQUIRE(recorder.finished.pop_until(std::chrono::steady_clock::now() +
                                        std::chrono::seconds(2)) == std::optional<uint64_t>(3));
    player.stop();
}

TEST_CASE("a failed write abandons the clip and reports once") {
    Recorder recorder;
    recorder.fail_writes = true;
    receptionist::audio::PacedPlayer player(recorder.callbacks());
    player.start();
    player.enqueue(9, std::string(320, '\x7F'));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(recorder.failures == 1);
    REQUIRE_FALSE(recorder.finished.try_pop());
    player.stop();
}
