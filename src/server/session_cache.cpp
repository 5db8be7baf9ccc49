#include "server/session_cache.hpp"

#include <iterator>
#include <mutex>

namespace keygate {

std::optional<SessionState> SessionCache::find(const std::string& key,
                                               std::chrono::system_clock::time_point now) const {
    if (key.empty()) return std::nullopt;

    std::shared_lock lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end() || it->second.expired(now)) return std::nullopt;
    return it->second;
}

bool SessionCache::store(const std::string& key, const SessionState& state,
                         std::chrono::system_clock::time_point now) {
    if (key.empty()) return false;

    std::unique_lock lock(mutex_);
    if (entries_.size() >= capacity_) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            it = it->second.expired(now) ? entries_.erase(it) : std::next(it);
        }
        if (entries_.size() >= capacity_) entries_.clear();
    }
    entries_.insert_or_assign(key, state);
    return true;
}

size_t SessionCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace keygate
