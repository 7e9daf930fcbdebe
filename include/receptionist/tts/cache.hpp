#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "receptionist/providers/audio_format.hpp"

namespace receptionist::tts {

// Shared synthesized-audio cache keyed by (provider, voice, exact text).
// Entries expire after the TTL; once full the oldest insertion is evicted.
class TtsCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    TtsCache(std::chrono::milliseconds ttl, size_t max_entries, Clock clock = nullptr);

    static std::string make_key(const std::string& provider,
                                const std::string& voice_id,
                                const std::string& text);

    std::optional<providers::AudioBuffer> get(const std::string& key);
    void put(const std::string& key, providers::AudioBuffer audio);
    size_t size() const;
    void clear();

private:
    struct Entry {
        providers::AudioBuffer audio;
        std::chrono::steady_clock::time_point created_at;
    };

    std::chrono::steady_clock::time_point now() const;
    void evict_oldest_locked();

    std::chrono::milliseconds ttl_;
    size_t max_entries_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::deque<std::string> insertion_order_;
};

}
