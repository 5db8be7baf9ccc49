#include "security/session_codec.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <vector>

namespace keygate {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

const EVP_CIPHER* cipher_for_key(size_t key_len) {
    switch (key_len) {
        case 16: return EVP_aes_128_gcm();
        case 24: return EVP_aes_192_gcm();
        case 32: return EVP_aes_256_gcm();
        default: return nullptr;
    }
}

bool secure_random_nonce(uint8_t* out, size_t len) {
    return RAND_bytes(out, static_cast<int>(len)) == 1;
}

// Same message for every post-decode failure
constexpr const char* kInvalidSession = "invalid session";

} // anonymous namespace

SessionCodec::SessionCodec(std::string key, NonceSource nonce_source)
    : key_(std::move(key)),
      nonce_source_(nonce_source ? std::move(nonce_source) : NonceSource(secure_random_nonce)) {}

Result<SessionCodec> SessionCodec::create(std::string key, NonceSource nonce_source) {
    if (!is_supported_key_length(key.size())) {
        return Result<SessionCodec>::error(ErrorCategory::INVALID_KEY,
            "session key must be 16, 24 or 32 bytes, got " + std::to_string(key.size()));
    }
    return Result<SessionCodec>::ok(SessionCodec(std::move(key), std::move(nonce_source)));
}

Result<std::string> SessionCodec::encrypt(std::string_view plaintext) const {
    if (plaintext.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "plaintext too large");
    }

    uint8_t nonce[kNonceLen];
    if (!nonce_source_(nonce, kNonceLen)) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            "failed to generate nonce");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            "failed to allocate cipher context");
    }

    const auto* key = reinterpret_cast<const uint8_t*>(key_.data());
    std::vector<uint8_t> packed(kNonceLen + plaintext.size() + kTagLen);
    uint8_t* const ct = packed.data() + kNonceLen;
    int len = 0;
    int ciphertext_len = 0;

    bool ok =
        EVP_EncryptInit_ex(ctx.get(), cipher_for_key(key_.size()), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceLen, nullptr) == 1 &&
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, nonce) == 1 &&
        EVP_EncryptUpdate(ctx.get(), ct, &len,
            reinterpret_cast<const uint8_t*>(plaintext.data()),
            static_cast<int>(plaintext.size())) == 1;
    if (ok) {
        ciphertext_len = len;
        ok = EVP_EncryptFinal_ex(ctx.get(), ct + ciphertext_len, &len) == 1;
        ciphertext_len += len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLen,
                                 ct + ciphertext_len) == 1;
    }
    if (!ok) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR, "encryption failed");
    }

    std::copy(nonce, nonce + kNonceLen, packed.begin());
    return Result<std::string>::ok(utils::bytes_to_hex(packed.data(), packed.size()));
}

Result<std::string> SessionCodec::decrypt(std::string_view text) const {
    std::string packed;
    if (!utils::hex_to_bytes(text, packed)) {
        return Result<std::string>::error(ErrorCategory::DECODE_ERROR,
            "session value is not valid hex");
    }

    if (packed.size() < kNonceLen + kTagLen) {
        return Result<std::string>::error(ErrorCategory::INVALID_SESSION, kInvalidSession);
    }

    const auto* data = reinterpret_cast<const uint8_t*>(packed.data());
    const uint8_t* nonce = data;
    const size_t ct_len = packed.size() - kNonceLen - kTagLen;
    const uint8_t* ct = data + kNonceLen;
    const uint8_t* tag = data + kNonceLen + ct_len;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            "failed to allocate cipher context");
    }

    const auto* key = reinterpret_cast<const uint8_t*>(key_.data());
    std::string plaintext(ct_len, '\0');
    auto* out = reinterpret_cast<uint8_t*>(plaintext.data());
    int len = 0;
    int plaintext_len = 0;

    bool ok =
        EVP_DecryptInit_ex(ctx.get(), cipher_for_key(key_.size()), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceLen, nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, nonce) == 1 &&
        EVP_DecryptUpdate(ctx.get(), out, &len, ct, static_cast<int>(ct_len)) == 1;
    if (ok) {
        plaintext_len = len;
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLen,
                                 const_cast<uint8_t*>(tag)) == 1 &&
             EVP_DecryptFinal_ex(ctx.get(), out + plaintext_len, &len) == 1;
    }
    if (!ok) {
        return Result<std::string>::error(ErrorCategory::INVALID_SESSION, kInvalidSession);
    }

    plaintext.resize(static_cast<size_t>(plaintext_len + len));
    return Result<std::string>::ok(std::move(plaintext));
}

Result<std::string> encode_text(std::string_view plaintext, std::string_view key) {
    auto codec = SessionCodec::create(std::string(key));
    if (codec.is_error()) return Result<std::string>::error_from(codec);
    return codec.value().encrypt(plaintext);
}

Result<std::string> decode_text(std::string_view text, std::string_view key) {
    auto codec = SessionCodec::create(std::string(key));
    if (codec.is_error()) return Result<std::string>::error_from(codec);
    return codec.value().decrypt(text);
}

} // namespace keygate
