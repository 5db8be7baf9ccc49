#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace keygate {

/**
 * @brief AES-GCM codec for session state stored in client cookies
 *
 * Wire format (hex-encoded for cookie transport):
 *   nonce (12 bytes) || ciphertext (len(plaintext)) || tag (16 bytes)
 *
 * The cipher is selected by key length: 16 → AES-128, 24 → AES-192,
 * 32 → AES-256. Every encryption draws a fresh nonce from the nonce source
 * (OpenSSL RAND_bytes unless a test injects its own).
 *
 * Decryption failures after hex decoding are all reported as
 * INVALID_SESSION with the same message, whether the input was truncated,
 * corrupt or forged.
 */
class SessionCodec {
public:
    static constexpr size_t kNonceLen = 12;
    static constexpr size_t kTagLen = 16;

    // Fills `len` bytes at `out`; returns false if no randomness was available
    using NonceSource = std::function<bool(uint8_t* out, size_t len)>;

    /**
     * @brief Build a codec bound to `key`
     * @return INVALID_KEY when the key is not 16, 24 or 32 bytes
     */
    [[nodiscard]] static Result<SessionCodec> create(std::string key,
                                                     NonceSource nonce_source = {});

    [[nodiscard]] static bool is_supported_key_length(size_t len) {
        return len == 16 || len == 24 || len == 32;
    }

    /**
     * @brief Seal plaintext and hex-encode nonce || ciphertext || tag
     */
    [[nodiscard]] Result<std::string> encrypt(std::string_view plaintext) const;

    /**
     * @brief Hex-decode and open a cookie value
     * @return DECODE_ERROR for invalid hex, INVALID_SESSION for anything that
     *         fails to authenticate
     */
    [[nodiscard]] Result<std::string> decrypt(std::string_view text) const;

    [[nodiscard]] size_t key_length() const { return key_.size(); }

private:
    SessionCodec(std::string key, NonceSource nonce_source);

    std::string key_;
    NonceSource nonce_source_;
};

// One-shot helpers for callers that hold the key rather than a codec
[[nodiscard]] Result<std::string> encode_text(std::string_view plaintext, std::string_view key);
[[nodiscard]] Result<std::string> decode_text(std::string_view text, std::string_view key);

} // namespace keygate
