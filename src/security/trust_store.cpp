#include "security/trust_store.hpp"
#include "core/utils.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <algorithm>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace keygate {

namespace {

struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return false;
    out = ss.str();
    return true;
}

// DER bodies of every CERTIFICATE block, in file order
std::vector<std::string> certificate_blocks(const std::string& pem) {
    std::vector<std::string> blocks;
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) return blocks;

    while (true) {
        char* name = nullptr;
        char* header = nullptr;
        unsigned char* data = nullptr;
        long len = 0;
        if (PEM_read_bio(bio.get(), &name, &header, &data, &len) != 1) break;
        if (std::strcmp(name, PEM_STRING_X509) == 0 ||
            std::strcmp(name, PEM_STRING_X509_OLD) == 0) {
            blocks.emplace_back(reinterpret_cast<const char*>(data), static_cast<size_t>(len));
        }
        OPENSSL_free(name);
        OPENSSL_free(header);
        OPENSSL_free(data);
    }
    ERR_clear_error();  // PEM_read_bio leaves "no start line" at end of input
    return blocks;
}

X509* parse_der(const std::string& der) {
    const auto* p = reinterpret_cast<const unsigned char*>(der.data());
    X509* cert = d2i_X509(nullptr, &p, static_cast<long>(der.size()));
    if (cert && p != reinterpret_cast<const unsigned char*>(der.data()) + der.size()) {
        // Trailing garbage after the certificate
        X509_free(cert);
        return nullptr;
    }
    return cert;
}

} // anonymous namespace

// ============================================================================
// TrustedCertificate
// ============================================================================

TrustedCertificate::TrustedCertificate(std::string cert_pem, std::string key_pem,
                                       X509* leaf, std::vector<X509*> chain, EVP_PKEY* key)
    : cert_pem_(std::move(cert_pem)),
      key_pem_(std::move(key_pem)),
      leaf_(leaf),
      chain_(std::move(chain)),
      key_(key) {}

TrustedCertificate::~TrustedCertificate() {
    release();
}

TrustedCertificate::TrustedCertificate(TrustedCertificate&& other) noexcept
    : cert_pem_(std::move(other.cert_pem_)),
      key_pem_(std::move(other.key_pem_)),
      leaf_(other.leaf_),
      chain_(std::move(other.chain_)),
      key_(other.key_) {
    other.leaf_ = nullptr;
    other.chain_.clear();
    other.key_ = nullptr;
}

TrustedCertificate& TrustedCertificate::operator=(TrustedCertificate&& other) noexcept {
    if (this != &other) {
        release();
        cert_pem_ = std::move(other.cert_pem_);
        key_pem_ = std::move(other.key_pem_);
        leaf_ = other.leaf_;
        chain_ = std::move(other.chain_);
        key_ = other.key_;
        other.leaf_ = nullptr;
        other.chain_.clear();
        other.key_ = nullptr;
    }
    return *this;
}

void TrustedCertificate::release() {
    if (leaf_) X509_free(leaf_);
    for (X509* c : chain_) X509_free(c);
    if (key_) EVP_PKEY_free(key_);
    leaf_ = nullptr;
    chain_.clear();
    key_ = nullptr;
}

std::string TrustedCertificate::subject() const {
    if (!leaf_) return {};
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) return {};
    X509_NAME_print_ex(bio.get(), X509_get_subject_name(leaf_), 0, XN_FLAG_RFC2253);
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    return (len > 0 && data) ? std::string(data, static_cast<size_t>(len)) : std::string{};
}

std::chrono::system_clock::time_point TrustedCertificate::not_after() const {
    if (!leaf_) return {};
    std::tm tm_buf{};
    if (ASN1_TIME_to_tm(X509_get0_notAfter(leaf_), &tm_buf) != 1) return {};
    return std::chrono::system_clock::from_time_t(::timegm(&tm_buf));
}

std::shared_ptr<SSL_CTX> TrustedCertificate::make_server_context() const {
    std::shared_ptr<SSL_CTX> ctx(SSL_CTX_new(TLS_server_method()), SSL_CTX_free);
    if (!ctx) {
        throw std::runtime_error("TLS: failed to create SSL_CTX");
    }

    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);

    if (SSL_CTX_use_certificate(ctx.get(), leaf_) != 1) {
        throw std::runtime_error("TLS: failed to install certificate " + subject());
    }
    for (X509* extra : chain_) {
        // add_extra_chain_cert takes ownership; hand it its own reference
        X509_up_ref(extra);
        if (SSL_CTX_add_extra_chain_cert(ctx.get(), extra) != 1) {
            X509_free(extra);
            throw std::runtime_error("TLS: failed to add chain certificate");
        }
    }
    if (SSL_CTX_use_PrivateKey(ctx.get(), key_) != 1) {
        throw std::runtime_error("TLS: failed to install private key");
    }
    if (SSL_CTX_check_private_key(ctx.get()) != 1) {
        throw std::runtime_error("TLS: private key does not match certificate");
    }
    return ctx;
}

// ============================================================================
// Loading
// ============================================================================

Result<TrustedCertificate> load_certificate(const std::string& cert_path,
                                            const std::string& key_path) {
    std::string cert_pem;
    if (!read_file(cert_path, cert_pem)) {
        return Result<TrustedCertificate>::error(ErrorCategory::IO_ERROR,
            "cannot read certificate file: " + cert_path);
    }

    std::string key_pem;
    if (!read_file(key_path, key_pem)) {
        return Result<TrustedCertificate>::error(ErrorCategory::IO_ERROR,
            "cannot read private key file: " + key_path);
    }

    return parse_certificate(std::move(cert_pem), std::move(key_pem));
}

Result<TrustedCertificate> parse_certificate(std::string cert_pem, std::string key_pem) {
    using R = Result<TrustedCertificate>;

    const auto blocks = certificate_blocks(cert_pem);
    if (blocks.empty()) {
        return R::error(ErrorCategory::KEY_PAIR_MISMATCH,
            "no CERTIFICATE block found in certificate input");
    }

    BioPtr key_bio(BIO_new_mem_buf(key_pem.data(), static_cast<int>(key_pem.size())));
    EVP_PKEY* key = key_bio
        ? PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr)
        : nullptr;
    if (!key) {
        ERR_clear_error();
        return R::error(ErrorCategory::KEY_PAIR_MISMATCH,
            "no usable private key found in key input");
    }

    X509* leaf = parse_der(blocks.front());
    if (!leaf) {
        ERR_clear_error();
        EVP_PKEY_free(key);
        return R::error(ErrorCategory::CERTIFICATE_PARSE_ERROR,
            "failed to parse leaf certificate");
    }

    if (X509_check_private_key(leaf, key) != 1) {
        ERR_clear_error();
        X509_free(leaf);
        EVP_PKEY_free(key);
        return R::error(ErrorCategory::KEY_PAIR_MISMATCH,
            "private key does not match certificate public key");
    }

    std::vector<X509*> chain;
    for (size_t i = 1; i < blocks.size(); ++i) {
        X509* extra = parse_der(blocks[i]);
        if (!extra) {
            ERR_clear_error();
            for (X509* c : chain) X509_free(c);
            X509_free(leaf);
            EVP_PKEY_free(key);
            return R::error(ErrorCategory::CERTIFICATE_PARSE_ERROR,
                "failed to parse chain certificate #" + std::to_string(i));
        }
        chain.push_back(extra);
    }

    return R::ok(TrustedCertificate(std::move(cert_pem), std::move(key_pem),
                                    leaf, std::move(chain), key));
}

// ============================================================================
// Refresh scheduling / cache keys
// ============================================================================

std::chrono::seconds refresh_within(std::chrono::system_clock::time_point expiry,
                                    double fraction) {
    return refresh_within(expiry, fraction, std::chrono::system_clock::now());
}

std::chrono::seconds refresh_within(std::chrono::system_clock::time_point expiry,
                                    double fraction,
                                    std::chrono::system_clock::time_point now) {
    const double left = std::chrono::duration<double>(expiry - now).count();
    if (left <= 0) {
        return std::chrono::seconds{0};
    }
    const auto seconds = static_cast<int64_t>(left * fraction);
    return std::chrono::seconds{seconds > 0 ? seconds : 0};
}

std::string cache_key(std::string_view encoded_token) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(encoded_token.data(), encoded_token.size(),
                   digest, &digest_len, EVP_md5(), nullptr) != 1) {
        // MD5 can be unavailable under a FIPS provider
        ERR_clear_error();
        if (EVP_Digest(encoded_token.data(), encoded_token.size(),
                       digest, &digest_len, EVP_sha256(), nullptr) != 1) {
            ERR_clear_error();
            utils::log::error("cache_key: no digest available");
            return {};
        }
    }

    // Keys stay 32 hex chars whichever digest produced them
    return utils::bytes_to_hex(digest, std::min(digest_len, 16u));
}

} // namespace keygate
