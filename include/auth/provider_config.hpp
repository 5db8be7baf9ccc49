#pragma once

#include "auth/http_transport.hpp"
#include "core/error.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keygate {

class JsonValue;

// Signing key published in the provider's JWKS
struct JsonWebKey {
    std::string kid;
    std::string kty;    // "RSA" or "EC"
    std::string alg;
    std::string use;
    // RSA
    std::string n, e;
    // EC
    std::string crv, x, y;
};

/**
 * @brief Identity provider metadata from OpenID Connect discovery
 *
 * Snapshots are immutable once built. Consumers share them through
 * std::shared_ptr<const ProviderConfig>; a refresh publishes a new snapshot
 * instead of editing the old one.
 */
struct ProviderConfig {
    std::string issuer;
    std::string authorization_endpoint;
    std::string token_endpoint;
    std::string userinfo_endpoint;
    std::string jwks_uri;
    std::string end_session_endpoint;
    std::vector<std::string> scopes_supported;
    std::vector<std::string> response_types_supported;
    std::vector<std::string> grant_types_supported;
    std::vector<std::string> id_token_signing_alg_values_supported;
    std::vector<std::string> token_endpoint_auth_methods_supported;

    std::vector<JsonWebKey> signing_keys;

    // From the discovery response's Cache-Control max-age; unset = no expiry
    std::optional<std::chrono::system_clock::time_point> expires_at;

    [[nodiscard]] const JsonWebKey* find_key(std::string_view kid) const;
};

using ProviderConfigPtr = std::shared_ptr<const ProviderConfig>;

inline constexpr std::string_view kDiscoverySuffix = "/.well-known/openid-configuration";

// Issuer URL with any trailing slash or well-known suffix removed
[[nodiscard]] std::string normalize_issuer_url(std::string_view url);

// Issuer URL + "/.well-known/openid-configuration"
[[nodiscard]] std::string discovery_document_url(std::string_view issuer_url);

// max-age directive of a Cache-Control header value
[[nodiscard]] std::optional<std::chrono::seconds> parse_max_age(std::string_view cache_control);

/**
 * @brief Parse a discovery document
 *
 * issuer, authorization_endpoint, token_endpoint and jwks_uri are required;
 * the issuer must match `expected_issuer` (trailing slashes ignored) when
 * one is given.
 *
 * @return PROVIDER_ERROR on malformed JSON or missing/mismatched fields
 */
[[nodiscard]] Result<ProviderConfig> parse_provider_config(const std::string& body,
                                                           std::string_view expected_issuer = {});

// Signing keys from a JWKS document; "enc" keys and keys without kid/kty are skipped
[[nodiscard]] Result<std::vector<JsonWebKey>> parse_jwks(const std::string& body);

/**
 * @brief Retrieves provider metadata and its signing keys
 */
class ProviderConfigFetcher {
public:
    explicit ProviderConfigFetcher(std::shared_ptr<IHttpTransport> transport);

    /**
     * @brief Discovery document + JWKS for the issuer at `issuer_url`
     *
     * expires_at is derived from the discovery response's Cache-Control.
     * @return PROVIDER_ERROR for unreachable endpoints, non-200 statuses or
     *         unparseable documents
     */
    [[nodiscard]] Result<ProviderConfig> fetch(const std::string& issuer_url) const;

private:
    std::shared_ptr<IHttpTransport> transport_;
};

} // namespace keygate
