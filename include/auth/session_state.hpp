#pragma once

#include "core/error.hpp"
#include "security/session_codec.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace keygate {

/**
 * @brief Authenticated session carried in the encrypted cookie
 *
 * Serialized as "<expiry unix seconds>|<access token>" before encryption.
 */
struct SessionState {
    std::chrono::system_clock::time_point expires_at;
    std::string token;

    [[nodiscard]] bool expired(std::chrono::system_clock::time_point now) const {
        return now >= expires_at;
    }

    [[nodiscard]] std::string serialize() const;

    // INVALID_SESSION when the separator or a numeric expiry is missing
    [[nodiscard]] static Result<SessionState> parse(std::string_view text);
};

/**
 * @brief Encrypt a session into a cookie value
 */
[[nodiscard]] Result<std::string> seal_session(const SessionCodec& codec,
                                               const SessionState& state);

/**
 * @brief Decrypt and parse a cookie value
 * @return The codec's DECODE_ERROR / INVALID_SESSION, or INVALID_SESSION for
 *         malformed or expired state
 */
[[nodiscard]] Result<SessionState> open_session(const SessionCodec& codec,
                                                std::string_view cookie_value,
                                                std::chrono::system_clock::time_point now);

} // namespace keygate
