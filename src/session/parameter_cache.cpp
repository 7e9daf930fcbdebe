#include "receptionist/session/parameter_cache.hpp"

#include "receptionist/logging.hpp"

namespace receptionist::session {

SessionParameterCache::SessionParameterCache(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {}

std::chrono::steady_clock::time_point SessionParameterCache::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

bool SessionParameterCache::expired(const Entry& entry,
                                    std::chrono::steady_clock::time_point now) const {
    return !entry.claimed && now - entry.stored_at >= ttl_;
}

void SessionParameterCache::put(SessionParameters parameters) {
    if (parameters.call_sid.empty()) {
        logging::warn("Refusing to cache session parameters without a call sid");
        return;
    }
    const auto stored_at = now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[parameters.call_sid];
    entry.parameters = std::move(parameters);
    entry.stored_at = stored_at;
}

std::optional<SessionParameters> SessionParameterCache::get(const std::string& call_sid) {
    const auto current = now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(call_sid);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (expired(it->second, current)) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.parameters;
}

std::optional<SessionParameters> SessionParameterCache::claim(const std::string& call_sid) {
    const auto current = now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(call_sid);
    if (it == entries_.end() || it->second.claimed) {
        return std::nullopt;
    }
    if (expired(it->second, current)) {
        entries_.erase(it);
        return std::nullopt;
    }
    it->second.claimed = true;
    return it->second.parameters;
}

void SessionParameterCache::release(const std::string& call_sid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(call_sid);
    if (it != entries_.end()) {
        it->second.claimed = false;
    }
}

bool SessionParameterCache::is_claimed(const std::string& call_sid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(call_sid);
    return it != entries_.end() && it->second.claimed;
}

void SessionParameterCache::erase(const std::string& call_sid) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(call_sid);
}

size_t SessionParameterCache::purge_expired() {
    const auto current = now();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (expired(it->second, current)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t SessionParameterCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}
