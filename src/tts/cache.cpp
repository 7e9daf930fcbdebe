#include "receptionist/tts/cache.hpp"

#include <algorithm>

namespace receptionist::tts {

TtsCache::TtsCache(std::chrono::milliseconds ttl, size_t max_entries, Clock clock)
    : ttl_(ttl),
      max_entries_(std::max<size_t>(1, max_entries)),
      clock_(std::move(clock)) {}

std::string TtsCache::make_key(const std::string& provider,
                               const std::string& voice_id,
                               const std::string& text) {
    return provider + '\x1f' + voice_id + '\x1f' + text;
}

std::chrono::steady_clock::time_point TtsCache::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

std::optional<providers::AudioBuffer> TtsCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now() - it->second.created_at >= ttl_) {
        entries_.erase(it);
        insertion_order_.erase(
            std::remove(insertion_order_.begin(), insertion_order_.end(), key),
            insertion_order_.end());
        return std::nullopt;
    }
    return it->second.audio;
}

void TtsCache::put(const std::string& key, providers::AudioBuffer audio) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        entries_.erase(existing);
        insertion_order_.erase(
            std::remove(insertion_order_.begin(), insertion_order_.end(), key),
            insertion_order_.end());
    }
    while (entries_.size() >= max_entries_) {
        evict_oldest_locked();
    }
    entries_[key] = Entry{std::move(audio), now()};
    insertion_order_.push_back(key);
}

void TtsCache::evict_oldest_locked() {
    if (insertion_order_.empty()) {
        entries_.clear();
        return;
    }
    entries_.erase(insertion_order_.front());
    insertion_order_.pop_front();
}

size_t TtsCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TtsCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    insertion_order_.clear();
}

}
