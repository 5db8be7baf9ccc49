#include "auth/session_state.hpp"
#include "core/utils.hpp"

#include <charconv>

namespace keygate {

std::string SessionState::serialize() const {
    return std::to_string(utils::to_unix_seconds(expires_at)) + "|" + token;
}

Result<SessionState> SessionState::parse(std::string_view text) {
    using R = Result<SessionState>;

    const auto sep = text.find('|');
    if (sep == std::string_view::npos || sep == 0) {
        return R::error(ErrorCategory::INVALID_SESSION, "session state has no expiry");
    }

    int64_t seconds = 0;
    const auto* first = text.data();
    const auto* last = text.data() + sep;
    const auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (ec != std::errc{} || ptr != last) {
        return R::error(ErrorCategory::INVALID_SESSION, "session expiry is not a number");
    }

    SessionState state;
    state.expires_at = utils::from_unix_seconds(seconds);
    state.token = std::string(text.substr(sep + 1));
    if (state.token.empty()) {
        return R::error(ErrorCategory::INVALID_SESSION, "session state has no token");
    }
    return R::ok(std::move(state));
}

Result<std::string> seal_session(const SessionCodec& codec, const SessionState& state) {
    return codec.encrypt(state.serialize());
}

Result<SessionState> open_session(const SessionCodec& codec,
                                  std::string_view cookie_value,
                                  std::chrono::system_clock::time_point now) {
    auto plaintext = codec.decrypt(cookie_value);
    if (plaintext.is_error()) return Result<SessionState>::error_from(plaintext);

    auto state = SessionState::parse(plaintext.value());
    if (state.is_error()) return state;

    if (state.value().expired(now)) {
        return Result<SessionState>::error(ErrorCategory::INVALID_SESSION, "session expired");
    }
    return state;
}

} // namespace keygate
