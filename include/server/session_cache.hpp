#pragma once

#include "auth/session_state.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace keygate {

/**
 * @brief Validated sessions keyed by cache_key() of the cookie value
 *
 * An empty key never matches and is never stored, so a digest failure
 * falls back to opening every cookie.
 */
class SessionCache {
public:
    explicit SessionCache(size_t capacity) : capacity_(capacity) {}

    // Unexpired session stored under `key`
    [[nodiscard]] std::optional<SessionState> find(const std::string& key,
                                                   std::chrono::system_clock::time_point now) const;

    /**
     * @brief Store `state` under `key`
     *
     * At capacity, expired entries are swept first and the cache is cleared
     * if that frees nothing.
     * @return false if `key` is empty
     */
    bool store(const std::string& key, const SessionState& state,
               std::chrono::system_clock::time_point now);

    [[nodiscard]] size_t size() const;

private:
    size_t capacity_;
    std::unordered_map<std::string, SessionState> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace keygate
