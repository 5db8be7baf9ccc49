#pragma once

#include <optional>
#include <string>
#include <utility>

namespace keygate {

/**
 * @brief Error categories for the proxy
 */
enum class ErrorCategory {
    NONE,
    DECODE_ERROR,              // Cookie text is not valid hex
    INVALID_SESSION,           // Too short, tampered, corrupt or expired session
    INVALID_KEY,               // Symmetric key has an unsupported length
    DISCOVERY_TIMEOUT,         // Provider metadata not obtained before the deadline
    PROVIDER_ERROR,            // Discovery / JWKS / token endpoint failure
    HIJACK_UNSUPPORTED,        // Transport cannot be taken over for raw I/O
    DIAL_ERROR,                // Upstream unreachable or TLS handshake failed
    IO_ERROR,                  // Read/write failure, missing file
    KEY_PAIR_MISMATCH,         // Certificate and private key do not correspond
    CERTIFICATE_PARSE_ERROR,   // Leaf certificate DER is malformed
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                    return "none";
        case ErrorCategory::DECODE_ERROR:            return "decode_error";
        case ErrorCategory::INVALID_SESSION:         return "invalid_session";
        case ErrorCategory::INVALID_KEY:             return "invalid_key";
        case ErrorCategory::DISCOVERY_TIMEOUT:       return "discovery_timeout";
        case ErrorCategory::PROVIDER_ERROR:          return "provider_error";
        case ErrorCategory::HIJACK_UNSUPPORTED:      return "hijack_unsupported";
        case ErrorCategory::DIAL_ERROR:              return "dial_error";
        case ErrorCategory::IO_ERROR:                return "io_error";
        case ErrorCategory::KEY_PAIR_MISMATCH:       return "key_pair_mismatch";
        case ErrorCategory::CERTIFICATE_PARSE_ERROR: return "certificate_parse_error";
        case ErrorCategory::CONFIG_ERROR:            return "config_error";
        case ErrorCategory::INTERNAL_ERROR:          return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    // Re-wrap another result's error under this value type
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Value-less result for operations that only succeed or fail
 */
struct Done {};
using Status = Result<Done>;

} // namespace keygate
