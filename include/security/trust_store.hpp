#pragma once

#include "core/error.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Forward-declare OpenSSL types
typedef struct x509_st X509;
typedef struct evp_pkey_st EVP_PKEY;
typedef struct ssl_ctx_st SSL_CTX;

namespace keygate {

/**
 * @brief Parsed certificate/private-key pair used for TLS termination
 *
 * Holds the raw PEM material alongside the parsed leaf, any chain
 * certificates that followed it in the certificate file, and the private
 * key. Immutable after loading; safe to share read-only across threads.
 */
class TrustedCertificate {
public:
    TrustedCertificate(std::string cert_pem, std::string key_pem,
                       X509* leaf, std::vector<X509*> chain, EVP_PKEY* key);
    ~TrustedCertificate();

    TrustedCertificate(const TrustedCertificate&) = delete;
    TrustedCertificate& operator=(const TrustedCertificate&) = delete;
    TrustedCertificate(TrustedCertificate&& other) noexcept;
    TrustedCertificate& operator=(TrustedCertificate&& other) noexcept;

    [[nodiscard]] X509* leaf() const { return leaf_; }
    [[nodiscard]] EVP_PKEY* private_key() const { return key_; }
    [[nodiscard]] const std::vector<X509*>& chain() const { return chain_; }
    [[nodiscard]] const std::string& cert_pem() const { return cert_pem_; }
    [[nodiscard]] const std::string& key_pem() const { return key_pem_; }

    // One-line RFC 2253 subject of the leaf, e.g. "CN=proxy.local"
    [[nodiscard]] std::string subject() const;

    // notAfter of the leaf
    [[nodiscard]] std::chrono::system_clock::time_point not_after() const;

    /**
     * @brief Build a TLS 1.2+ server context presenting this identity
     * @throws std::runtime_error if OpenSSL rejects the material
     */
    [[nodiscard]] std::shared_ptr<SSL_CTX> make_server_context() const;

private:
    void release();

    std::string cert_pem_;
    std::string key_pem_;
    X509* leaf_ = nullptr;
    std::vector<X509*> chain_;
    EVP_PKEY* key_ = nullptr;
};

/**
 * @brief Load a PEM certificate (optionally followed by its chain) and key
 *
 * @return IO_ERROR if either file cannot be read,
 *         KEY_PAIR_MISMATCH if a PEM block is missing or the key does not
 *         belong to the certificate,
 *         CERTIFICATE_PARSE_ERROR if the leaf DER is malformed
 */
[[nodiscard]] Result<TrustedCertificate> load_certificate(const std::string& cert_path,
                                                          const std::string& key_path);

// Same as load_certificate() but from PEM text already in memory
[[nodiscard]] Result<TrustedCertificate> parse_certificate(std::string cert_pem,
                                                           std::string key_pem);

/**
 * @brief Duration covering `fraction` of the time left until `expiry`
 *
 * Something expiring in one hour with fraction 0.8 yields 48 minutes.
 * Truncated to whole seconds; zero once `expiry` has passed.
 */
[[nodiscard]] std::chrono::seconds refresh_within(
    std::chrono::system_clock::time_point expiry, double fraction);

[[nodiscard]] std::chrono::seconds refresh_within(
    std::chrono::system_clock::time_point expiry, double fraction,
    std::chrono::system_clock::time_point now);

/**
 * @brief Stable lookup key for a signed token: hex MD5 of its encoded form
 *
 * Only ever used to index caches. Not a MAC, never compared as a credential.
 */
[[nodiscard]] std::string cache_key(std::string_view encoded_token);

} // namespace keygate
